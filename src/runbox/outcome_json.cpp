#include "outcome_json.h"

#include <nlohmann/json.hpp>

nlohmann::json OutcomeToJson(const ExecutionOutcome& outcome) {
  nlohmann::json error_message = nullptr;
  if (outcome.error_message) error_message = *outcome.error_message;
  return {
    {"status", ExecStatusName(outcome.status)},
    {"stdout", outcome.stdout_data},
    {"stderr", outcome.stderr_data},
    {"error_message", error_message},
    {"stats", {
      {"worker_pid", outcome.worker_pid},
      {"wall_time_us", outcome.wall_time},
      {"exit_code", outcome.exit_code},
      {"signal", outcome.term_signal},
      {"output_truncated", outcome.output_truncated},
    }},
  };
}
