#ifndef INCLUDE_RUNBOX_OUTCOME_H_
#define INCLUDE_RUNBOX_OUTCOME_H_

#include <string>
#include <optional>

#define ENUM_EXEC_STATUS_ \
  X(COMPLETED, "Completed") \
  X(TIMED_OUT, "TimedOut") \
  X(UNSAFE, "Unsafe") /* rejected before execution */ \
  X(CRASHED, "Crashed")
enum class ExecStatus {
#define X(name, desc) name,
  ENUM_EXEC_STATUS_
#undef X
};

class ExecutionOutcome {
 public:
  ExecStatus status;
  std::string stdout_data, stderr_data;
  std::optional<std::string> error_message;

  // stats
  int worker_pid; // 0 if no worker was spawned
  long wall_time; // us
  int exit_code; // -1 if not exited normally
  int term_signal; // 0 if not killed by signal
  bool output_truncated;

  ExecutionOutcome() :
      status(ExecStatus::CRASHED),
      worker_pid(0),
      wall_time(0),
      exit_code(-1),
      term_signal(0),
      output_truncated(false) {}
};

const char* ExecStatusName(ExecStatus);

#endif  // INCLUDE_RUNBOX_OUTCOME_H_
