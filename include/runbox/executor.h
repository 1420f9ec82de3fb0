#ifndef INCLUDE_RUNBOX_EXECUTOR_H_
#define INCLUDE_RUNBOX_EXECUTOR_H_

#include <chrono>
#include <string>
#include <vector>

#include <runbox/outcome.h>
#include <runbox/safety_filter.h>

extern const std::vector<std::string> kDefaultAllowedBuiltins;
// us
constexpr long kDefaultTimeout = 5'000'000;
// us; longer timeouts are clamped so the deadline stays representable
constexpr long kMaxTimeout = std::chrono::duration_cast<std::chrono::microseconds>(
    std::chrono::steady_clock::duration::max()).count() / 2;

class ExecutorOptions {
 public:
  std::string interpreter;
  // the only names visible as builtins to the submitted code
  std::vector<std::string> allowed_builtins;
  std::vector<std::string> denylist;
  long max_output; // bytes per stream; 0 for unlimited
  long vss; // KiB; 0 for unlimited
  long fsize; // KiB; 0 for unlimited
  int file_num; // 0 for unlimited

  ExecutorOptions() :
      interpreter("/usr/bin/python3"),
      allowed_builtins(kDefaultAllowedBuiltins),
      denylist(kDefaultDenylist),
      max_output(1024 * 1024),
      vss(256 * 1024),
      fsize(1024),
      file_num(64) {}
};

struct CodeSubmission {
  const std::string source;
  const long timeout; // us
};

// Execute blocks until the worker finishes or the timeout fires. The worker
// process is always terminated and reaped before Execute returns.
// Thread-safe; concurrent calls use independent workers.
class SandboxExecutor {
  ExecutorOptions opt_;
  SafetyFilter filter_;
 public:
  SandboxExecutor() : SandboxExecutor(ExecutorOptions()) {}
  explicit SandboxExecutor(const ExecutorOptions& opt) : opt_(opt), filter_(opt.denylist) {}

  ExecutionOutcome Execute(const std::string& source, long timeout = kDefaultTimeout) const;
  ExecutionOutcome Execute(const CodeSubmission& sub) const {
    return Execute(sub.source, sub.timeout);
  }

  const ExecutorOptions& Options() const { return opt_; }
  const SafetyFilter& Filter() const { return filter_; }
};

#endif  // INCLUDE_RUNBOX_EXECUTOR_H_
