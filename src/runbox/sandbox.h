#ifndef RUNBOX_SANDBOX_H_
#define RUNBOX_SANDBOX_H_

#include <sys/types.h>
#include <chrono>
#include <string>
#include <vector>

// the worker writes its single result message on this fd
constexpr int kResultChannelFd = 3;
// us; a longer wall_time is clamped to this
constexpr long kMaxWallTime = std::chrono::duration_cast<std::chrono::microseconds>(
    std::chrono::steady_clock::duration::max()).count() / 2;

class SandboxOptions {
 public:
  std::vector<std::string> command; // command[0] must be an absolute path
  std::vector<std::string> envs;
  std::string input; // delivered on the worker's stdin, then EOF
  long wall_time; // us; must be set
  long cpu_time; // us; 0 for unlimited
  long vss; // KiB
  long fsize; // KiB
  int file_num;
  long result_limit; // bytes

  SandboxOptions() :
      wall_time(0), cpu_time(0),
      vss(0), fsize(0),
      file_num(0),
      result_limit(0) {}
};

struct SandboxResult {
  pid_t pid; // 0 if the worker was never started
  bool error; // failed to set up or start the worker; see sys_errno
  int sys_errno;
  bool timed_out; // deadline passed before the result channel was closed
  bool result_overflow; // killed after exceeding result_limit
  int exit_code; // -1 if not exited normally
  int term_signal; // 0 if not killed by a signal
  long wall_time; // us
  std::string result; // bytes read from the result channel

  SandboxResult() :
      pid(0), error(false), sys_errno(0),
      timed_out(false), result_overflow(false),
      exit_code(-1), term_signal(0), wall_time(0) {}
};

// Owns a worker pid. The destructor kills the worker's process group and
// waits for it, so a worker never outlives the scope that started it.
class WorkerProcess {
  pid_t pid_;
  int status_;
  bool exited_;
  bool reaped_;
 public:
  explicit WorkerProcess(pid_t pid) : pid_(pid), status_(0), exited_(false), reaped_(false) {}
  ~WorkerProcess() { Kill(); }
  WorkerProcess(const WorkerProcess&) = delete;
  WorkerProcess& operator=(const WorkerProcess&) = delete;

  pid_t Pid() const { return pid_; }
  int Status() const { return status_; }
  // Non-blocking. An exited leader is left unreaped; its zombie keeps the
  // process group id from being reused until Kill.
  bool Exited();
  // SIGKILL to the whole process group, then blocking wait for the leader;
  // no-op if already reaped
  void Kill();
};

// Starts one worker, feeds it input, collects its result message and reaps it.
// Returns after the worker has terminated on every path.
SandboxResult SandboxExec(const SandboxOptions&);

#endif  // RUNBOX_SANDBOX_H_
