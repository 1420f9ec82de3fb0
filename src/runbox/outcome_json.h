#ifndef RUNBOX_OUTCOME_JSON_H_
#define RUNBOX_OUTCOME_JSON_H_

#include <runbox/outcome.h>
#include <nlohmann/json_fwd.hpp>

nlohmann::json OutcomeToJson(const ExecutionOutcome&);

#endif  // RUNBOX_OUTCOME_JSON_H_
