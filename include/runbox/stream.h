#ifndef INCLUDE_RUNBOX_STREAM_H_
#define INCLUDE_RUNBOX_STREAM_H_

#include <string>
#include <optional>
#include <functional>

#include <runbox/cancellation.h>

struct StreamResult {
  SessionOutcome outcome;
  size_t units; // units handed to emit
  std::string error; // set if outcome is ERRORED
};

// Producer side of a streaming session:
//   next() returns the next output unit, or nullopt when the stream is finished;
//   emit() delivers a unit to the consumer.
// The registry is checked before each unit, so an Abort stops the loop after
// at most one more unit. Exceptions from either callback end the session as
// ERRORED. The session is ended on every path.
StreamResult RunStream(CancellationRegistry& registry, const std::string& request_id,
                       const std::function<std::optional<std::string>()>& next,
                       const std::function<void(const std::string&)>& emit);

#endif  // INCLUDE_RUNBOX_STREAM_H_
