#include "sandbox.h"

#include <poll.h>
#include <fcntl.h>
#include <signal.h>
#include <unistd.h>
#include <sys/prctl.h>
#include <sys/resource.h>
#include <sys/socket.h>
#include <sys/wait.h>
#include <algorithm>
#include <cerrno>
#include <chrono>
#include <climits>
#include <cstring>
#include <thread>

#include <fmt/ranges.h>
#include <spdlog/spdlog.h>
#include "utils.h"

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kSetupFailure = 126;
constexpr int kExecFailure = 127;
// fds are moved above this before being placed at 0 and kResultChannelFd
constexpr int kScratchFd = 10;

struct ChildLimits {
  rlim_t vss, cpu, fsize, nofile;
};

inline bool SetLimit(int resource, rlim_t value) {
  struct rlimit lim = {value, value};
  return setrlimit(resource, &lim) == 0;
}

/// child
// Only async-signal-safe calls from here on; other threads of the host may
//  hold locks (allocator, logger) that will never be released in this process.
[[noreturn]] void RunWorker(char* const* argv, char* const* envp, const ChildLimits& lim,
                            int input_fd, int result_fd, pid_t host) {
  setpgid(0, 0);
  if (prctl(PR_SET_PDEATHSIG, SIGKILL) < 0 || getppid() != host) _exit(kSetupFailure);

  int in = fcntl(input_fd, F_DUPFD, kScratchFd);
  int res = fcntl(result_fd, F_DUPFD, kScratchFd);
  int null_fd = open("/dev/null", O_RDWR);
  if (in < 0 || res < 0 || null_fd < 0) _exit(kSetupFailure);
  if (dup2(in, 0) < 0 || dup2(null_fd, 1) < 0 || dup2(null_fd, 2) < 0 ||
      dup2(res, kResultChannelFd) < 0) {
    _exit(kSetupFailure);
  }
  if (CloseFrom(kResultChannelFd + 1) < 0) _exit(kSetupFailure);

  if (!SetLimit(RLIMIT_CORE, 0)) _exit(kSetupFailure);
  if (lim.vss && !SetLimit(RLIMIT_AS, lim.vss)) _exit(kSetupFailure);
  if (lim.cpu && !SetLimit(RLIMIT_CPU, lim.cpu)) _exit(kSetupFailure);
  if (lim.fsize && !SetLimit(RLIMIT_FSIZE, lim.fsize)) _exit(kSetupFailure);
  if (lim.nofile && !SetLimit(RLIMIT_NOFILE, lim.nofile)) _exit(kSetupFailure);

  execve(argv[0], argv, envp);
  _exit(kExecFailure);
}

/// parent
inline SandboxResult& Fail(SandboxResult& ret, const char* what) {
  ret.error = true;
  ret.sys_errno = errno;
  spdlog::warn("SandboxExec {} error: errno={} {}", what, errno, strerror(errno));
  return ret;
}

inline int PollTimeout(Clock::time_point deadline) {
  long us = ToUs(deadline - Clock::now());
  if (us <= 0) return 0;
  return (int)std::min<long>((us + 999) / 1000, INT_MAX);
}

} // namespace

bool WorkerProcess::Exited() {
  if (exited_ || reaped_) return true;
  siginfo_t info;
  info.si_pid = 0;
  if (waitid(P_PID, pid_, &info, WEXITED | WNOHANG | WNOWAIT) < 0) {
    if (errno == EINTR) return false;
    spdlog::warn("waitid pid={} error: errno={} {}", pid_, errno, strerror(errno));
    // nothing left to wait for
    reaped_ = true;
    return true;
  }
  if (info.si_pid == pid_) exited_ = true;
  return exited_;
}

void WorkerProcess::Kill() {
  if (reaped_) return;
  // the leader is not reaped yet, so the group id still belongs to this worker
  kill(-pid_, SIGKILL);
  kill(pid_, SIGKILL);
  while (true) {
    pid_t r = waitpid(pid_, &status_, 0);
    if (r == pid_) break;
    if (r < 0 && errno != EINTR) {
      spdlog::warn("waitpid pid={} error: errno={} {}", pid_, errno, strerror(errno));
      break;
    }
  }
  reaped_ = true;
  spdlog::debug("Worker group killed and reaped: pid={} exited_before={}", pid_, exited_);
}

SandboxResult SandboxExec(const SandboxOptions& opt) {
  SandboxResult ret;
  if (opt.command.empty() || opt.wall_time <= 0) {
    errno = EINVAL;
    return Fail(ret, "options");
  }

  // everything the child needs is built before fork
  std::vector<char*> argv, envp;
  for (auto& i : opt.command) argv.push_back(const_cast<char*>(i.c_str()));
  argv.push_back(nullptr);
  for (auto& i : opt.envs) envp.push_back(const_cast<char*>(i.c_str()));
  envp.push_back(nullptr);
  ChildLimits lim = {
    (rlim_t)opt.vss * 1024,
    (rlim_t)(opt.cpu_time / 1'000'000 + (opt.cpu_time % 1'000'000 != 0)),
    (rlim_t)opt.fsize * 1024,
    (rlim_t)opt.file_num,
  };

  // a socket lets us write with MSG_NOSIGNAL; a dead worker must not SIGPIPE the host
  int sock[2], chan[2];
  if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, sock) < 0) return Fail(ret, "socketpair");
  UniqueFd input_w(sock[0]), input_r(sock[1]);
  if (pipe2(chan, O_CLOEXEC) < 0) return Fail(ret, "pipe");
  UniqueFd result_r(chan[0]), result_w(chan[1]);

  const auto start = Clock::now();
  const auto deadline = start + std::chrono::microseconds(std::min(opt.wall_time, kMaxWallTime));
  pid_t host = getpid();
  pid_t pid = fork();
  if (pid < 0) return Fail(ret, "fork");
  if (pid == 0) RunWorker(argv.data(), envp.data(), lim, input_r.Get(), result_w.Get(), host);

  WorkerProcess worker(pid);
  // also done by the child; whichever runs first wins
  IGNORE_RETURN(setpgid(pid, pid));
  ret.pid = pid;
  input_r.Reset();
  result_w.Reset();
  spdlog::debug("Worker started: pid={} command={} input_bytes={}",
                pid, fmt::format("{}", opt.command), opt.input.size());

  size_t written = 0;
  if (opt.input.empty()) input_w.Reset();
  bool eof = false;
  char buf[65536];
  while (true) {
    if (Clock::now() >= deadline) {
      ret.timed_out = true;
      break;
    }
    struct pollfd fds[2] = {{result_r.Get(), POLLIN, 0}, {input_w.Get(), POLLOUT, 0}};
    int nfds = input_w ? 2 : 1;
    int n = poll(fds, nfds, PollTimeout(deadline));
    if (n < 0) {
      if (errno == EINTR) continue;
      Fail(ret, "poll");
      break;
    }
    if (n == 0) continue;
    if (input_w && fds[1].revents) {
      if (fds[1].revents & (POLLERR | POLLHUP)) {
        input_w.Reset();
      } else {
        ssize_t w = send(input_w.Get(), opt.input.data() + written, opt.input.size() - written,
                         MSG_NOSIGNAL | MSG_DONTWAIT);
        if (w >= 0) {
          written += w;
          if (written == opt.input.size()) input_w.Reset();
        } else if (errno != EAGAIN && errno != EINTR) {
          // the worker stopped reading; whatever it reports is still collected
          spdlog::debug("Worker input closed early: pid={} written={}", pid, written);
          input_w.Reset();
        }
      }
    }
    if (fds[0].revents) {
      ssize_t r = read(result_r.Get(), buf, sizeof(buf));
      if (r < 0) {
        if (errno == EINTR || errno == EAGAIN) continue;
        Fail(ret, "read");
        break;
      }
      if (r == 0) {
        eof = true;
        break;
      }
      ret.result.append(buf, r);
      if (opt.result_limit && (long)ret.result.size() > opt.result_limit) {
        ret.result_overflow = true;
        break;
      }
    }
  }
  input_w.Reset();
  result_r.Reset();

  if (eof) {
    // the result is in; give the worker until the deadline to exit by itself
    while (!worker.Exited() && Clock::now() < deadline) {
      std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
  }
  if (ret.timed_out) spdlog::warn("Worker timed out, killing: pid={}", pid);
  // also on a normal exit: background processes left in the group go too
  worker.Kill();
  ret.wall_time = ToUs(Clock::now() - start);

  int status = worker.Status();
  if (WIFEXITED(status)) ret.exit_code = WEXITSTATUS(status);
  if (WIFSIGNALED(status)) ret.term_signal = WTERMSIG(status);
  spdlog::debug("Worker finished: pid={} code={} signal={} timed_out={} result_bytes={} time={}",
                pid, ret.exit_code, ret.term_signal, ret.timed_out, ret.result.size(), ret.wall_time);
  return ret;
}
