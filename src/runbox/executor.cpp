#include <runbox/executor.h>

#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <cstring>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <nlohmann/json.hpp>
#include "bootstrap.h"
#include "sandbox.h"

const std::vector<std::string> kDefaultAllowedBuiltins = {
  // output
  "print",
  // types and containers
  "bool", "int", "float", "complex", "str", "list", "dict", "set", "frozenset", "tuple",
  "object", "slice", "__build_class__",
  // numeric
  "abs", "divmod", "pow", "round", "min", "max", "sum",
  // strings
  "chr", "ord", "repr", "format", "bin", "hex", "oct",
  // iteration
  "len", "range", "enumerate", "zip", "map", "filter", "sorted", "reversed",
  "iter", "next", "any", "all", "isinstance",
  // exceptions the submission may raise or catch
  "Exception", "ArithmeticError", "ZeroDivisionError", "ValueError", "TypeError",
  "KeyError", "IndexError", "StopIteration", "RuntimeError", "NameError", "AssertionError",
};

namespace {

// room for the JSON envelope and escaping around two capped streams
constexpr long kResultOverhead = 64 * 1024;
// CPU limit as a backstop, this far above the wall-clock limit
constexpr long kCpuTimeSlack = 1'000'000;

inline long ResultLimit(long max_output) {
  if (!max_output) return 0;
  // escaping can expand a byte to six (\u00XX)
  return max_output * 2 * 6 + kResultOverhead;
}

std::string TimeoutMessage(long timeout) {
  return fmt::format("execution exceeded {}s", timeout / 1e6);
}

std::string NoResultMessage(const SandboxResult& res) {
  if (res.term_signal) {
    const char* desc = sigdescr_np(res.term_signal);
    return fmt::format("worker exited without a result (killed by signal {}: {})",
                       res.term_signal, desc ? desc : "unknown");
  }
  return fmt::format("worker exited without a result (exit status {})", res.exit_code);
}

// fill outcome from the worker's result message; false if malformed
bool ParseResult(const std::string& message, ExecutionOutcome& outcome) {
  try {
    nlohmann::json json = nlohmann::json::parse(message);
    outcome.stdout_data = json.at("stdout").get<std::string>();
    outcome.stderr_data = json.at("stderr").get<std::string>();
    outcome.output_truncated = json.value("truncated", false);
    if (auto it = json.find("error"); it != json.end() && it->is_string()) {
      outcome.status = ExecStatus::CRASHED;
      outcome.error_message = it->get<std::string>();
      outcome.stderr_data += json.value("traceback", std::string());
    } else {
      outcome.status = ExecStatus::COMPLETED;
    }
  } catch (nlohmann::json::exception& e) {
    spdlog::warn("Malformed worker result: {}", e.what());
    outcome.stdout_data.clear();
    outcome.stderr_data.clear();
    outcome.output_truncated = false;
    return false;
  }
  return true;
}

} // namespace

ExecutionOutcome SandboxExecutor::Execute(const std::string& source, long timeout) const {
  ExecutionOutcome outcome;
  if (auto token = filter_.Check(source)) {
    spdlog::info("Submission rejected: forbidden identifier '{}'", *token);
    outcome.status = ExecStatus::UNSAFE;
    outcome.error_message = fmt::format("unsafe submission: forbidden identifier '{}'", *token);
    return outcome;
  }
  if (timeout <= 0) {
    outcome.status = ExecStatus::CRASHED;
    outcome.error_message = fmt::format("invalid timeout: {}us", timeout);
    return outcome;
  }
  if (access(opt_.interpreter.c_str(), X_OK) < 0) {
    spdlog::warn("Interpreter {} not executable: {}", opt_.interpreter, strerror(errno));
    outcome.status = ExecStatus::CRASHED;
    outcome.error_message = fmt::format("interpreter not executable: {}", opt_.interpreter);
    return outcome;
  }

  SandboxOptions sandbox;
  sandbox.command = WorkerCommand(opt_);
  sandbox.envs = WorkerEnvs();
  sandbox.input = source;
  // clamped, so the slack cannot overflow
  sandbox.wall_time = std::min(timeout, kMaxTimeout);
  sandbox.cpu_time = sandbox.wall_time + kCpuTimeSlack;
  sandbox.vss = opt_.vss;
  sandbox.fsize = opt_.fsize;
  sandbox.file_num = opt_.file_num;
  sandbox.result_limit = ResultLimit(opt_.max_output);

  SandboxResult res = SandboxExec(sandbox);
  outcome.worker_pid = res.pid;
  outcome.wall_time = res.wall_time;
  outcome.exit_code = res.exit_code;
  outcome.term_signal = res.term_signal;

  if (res.error) {
    outcome.status = ExecStatus::CRASHED;
    outcome.error_message = fmt::format("worker failure: {}", strerror(res.sys_errno));
  } else if (res.timed_out) {
    outcome.status = ExecStatus::TIMED_OUT;
    outcome.error_message = TimeoutMessage(timeout);
  } else if (res.result_overflow) {
    outcome.status = ExecStatus::CRASHED;
    outcome.error_message = fmt::format("worker result exceeded {} bytes", sandbox.result_limit);
  } else if (res.result.empty()) {
    outcome.status = ExecStatus::CRASHED;
    outcome.error_message = NoResultMessage(res);
  } else if (!ParseResult(res.result, outcome)) {
    outcome.status = ExecStatus::CRASHED;
    outcome.error_message = "malformed worker result";
  }
  spdlog::info("Execution finished: pid={} status={} time={} code={} signal={}",
               outcome.worker_pid, ExecStatusName(outcome.status), outcome.wall_time,
               outcome.exit_code, outcome.term_signal);
  return outcome;
}
