#include <runbox/executor.h>

#include <chrono>
#include <climits>
#include <thread>
#include <vector>

#include <gmock/gmock-matchers.h>
#include "utils.h"

using ::testing::HasSubstr;
using ::testing::StartsWith;

namespace {

constexpr long kTimeout = 10'000'000;

} // namespace

TEST(Executor, PrintsHello) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("print(\"hello\")\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::COMPLETED);
  EXPECT_EQ(outcome.stdout_data, "hello\n");
  EXPECT_EQ(outcome.stderr_data, "");
  EXPECT_FALSE(outcome.error_message.has_value());
  EXPECT_FALSE(outcome.output_truncated);
  EXPECT_GT(outcome.worker_pid, 0);
  EXPECT_TRUE(IsGone(outcome.worker_pid));
}

TEST(Executor, AcceptsCodeSubmission) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute(CodeSubmission{"print(sum(range(5)))", kTimeout});
  EXPECT_STATUS(outcome, ExecStatus::COMPLETED);
  EXPECT_EQ(outcome.stdout_data, "10\n");
}

TEST(Executor, CoreOperationsAvailable) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute(R"(
class Point:
    def __init__(self, x, y):
        self.x, self.y = x, y
words = sorted(['pear', 'apple', 'fig'], key=len)
squares = {n: n * n for n in range(4)}
p = Point(3, 4)
print(words, squares, abs(-2.5), max(p.x, p.y), round(10 / 4, 1))
try:
    [][1]
except IndexError:
    print('caught')
)", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::COMPLETED);
  EXPECT_EQ(outcome.stdout_data,
            "['fig', 'pear', 'apple'] {0: 0, 1: 1, 2: 4, 3: 9} 2.5 4 2.5\ncaught\n");
}

TEST(Executor, UnsafeSpawnsNothing) {
  SandboxExecutor executor;
  int before = CountChildren();
  ExecutionOutcome outcome = executor.Execute("x = eval('1 + 1')\nprint(x)\n", kTimeout);
  EXPECT_EQ(CountChildren() - before, 0);
  EXPECT_STATUS(outcome, ExecStatus::UNSAFE);
  EXPECT_EQ(outcome.worker_pid, 0);
  EXPECT_EQ(outcome.stdout_data, "");
  ASSERT_TRUE(outcome.error_message.has_value());
  EXPECT_THAT(*outcome.error_message, HasSubstr("'eval'"));
}

TEST(Executor, UnsafeInsideComment) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("# do not open files\nprint(1)\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::UNSAFE);
  EXPECT_THAT(outcome.error_message.value_or(""), HasSubstr("'open'"));
}

TEST(Executor, TimeoutKillsAndReaps) {
  SandboxExecutor executor;
  auto start = std::chrono::steady_clock::now();
  ExecutionOutcome outcome = executor.Execute("while True:\n    pass\n", 2'000'000);
  auto elapsed = std::chrono::steady_clock::now() - start;
  EXPECT_STATUS(outcome, ExecStatus::TIMED_OUT);
  EXPECT_EQ(outcome.error_message, "execution exceeded 2s");
  EXPECT_GE(elapsed, std::chrono::seconds(2));
  EXPECT_LT(elapsed, std::chrono::milliseconds(2500));
  EXPECT_TRUE(IsGone(outcome.worker_pid));
  EXPECT_EQ(CountChildren(), 0);
}

TEST(Executor, TimeoutMessageKeepsFraction) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("while True:\n    pass\n", 500'000);
  EXPECT_STATUS(outcome, ExecStatus::TIMED_OUT);
  EXPECT_EQ(outcome.error_message, "execution exceeded 0.5s");
}

TEST(Executor, HugeTimeoutCompletes) {
  SandboxExecutor executor;
  for (long timeout : {kMaxTimeout, kMaxTimeout + 1, LONG_MAX / 2, LONG_MAX}) {
    ExecutionOutcome outcome = executor.Execute("print('ok')\n", timeout);
    EXPECT_STATUS(outcome, ExecStatus::COMPLETED);
    EXPECT_EQ(outcome.stdout_data, "ok\n");
  }
}

TEST(Executor, ExceptionIsCrashed) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("print('before')\nraise ValueError('bad input')\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_EQ(outcome.error_message, "ValueError: bad input");
  EXPECT_EQ(outcome.stdout_data, "before\n");
  EXPECT_THAT(outcome.stderr_data, HasSubstr("Traceback"));
  EXPECT_TRUE(IsGone(outcome.worker_pid));
}

TEST(Executor, DivisionByZero) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("print(1 / 0)\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_THAT(outcome.error_message.value_or(""), StartsWith("ZeroDivisionError"));
}

TEST(Executor, SyntaxError) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("print(\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_THAT(outcome.error_message.value_or(""), StartsWith("SyntaxError"));
}

TEST(Executor, ImportUnavailable) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("import math\nprint(math.pi)\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_THAT(outcome.error_message.value_or(""), StartsWith("ImportError"));
}

TEST(Executor, BuiltinOutsideAllowList) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("print(input())\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_EQ(outcome.error_message, "NameError: name 'input' is not defined");
}

TEST(Executor, CustomAllowList) {
  ExecutorOptions opt;
  opt.allowed_builtins = {"print", "len"};
  SandboxExecutor executor(opt);
  ExecutionOutcome ok = executor.Execute("print(len('abc'))\n", kTimeout);
  EXPECT_STATUS(ok, ExecStatus::COMPLETED);
  EXPECT_EQ(ok.stdout_data, "3\n");
  ExecutionOutcome missing = executor.Execute("print(sum([1, 2]))\n", kTimeout);
  EXPECT_STATUS(missing, ExecStatus::CRASHED);
  EXPECT_EQ(missing.error_message, "NameError: name 'sum' is not defined");
}

TEST(Executor, CustomDenylist) {
  ExecutorOptions opt;
  opt.denylist = {"print"};
  SandboxExecutor executor(opt);
  EXPECT_STATUS(executor.Execute("print(1)\n", kTimeout), ExecStatus::UNSAFE);
  opt.denylist.clear();
  SandboxExecutor permissive(opt);
  ExecutionOutcome outcome = permissive.Execute("# eval is not reachable anyway\nprint(2)\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::COMPLETED);
  EXPECT_EQ(outcome.stdout_data, "2\n");
}

TEST(Executor, OutputTruncated) {
  ExecutorOptions opt;
  opt.max_output = 10;
  SandboxExecutor executor(opt);
  ExecutionOutcome outcome = executor.Execute("print('x' * 100)\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::COMPLETED);
  EXPECT_EQ(outcome.stdout_data, std::string(10, 'x'));
  EXPECT_TRUE(outcome.output_truncated);
}

TEST(Executor, LargeSourceAndOutput) {
  SandboxExecutor executor;
  // both directions are larger than a pipe buffer
  std::string source = "# " + std::string(1 << 20, '-') + "\nprint('y' * 200000)\n";
  ExecutionOutcome outcome = executor.Execute(source, kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::COMPLETED);
  EXPECT_EQ(outcome.stdout_data, std::string(200000, 'y') + "\n");
}

TEST(Executor, Utf8RoundTrip) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("print('héllo wörld ✓')\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::COMPLETED);
  EXPECT_EQ(outcome.stdout_data, "héllo wörld ✓\n");
}

TEST(Executor, MemoryLimit) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("x = [0] * (10 ** 9)\nprint(len(x))\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_THAT(outcome.error_message.value_or(""), StartsWith("MemoryError"));
}

TEST(Executor, MissingInterpreter) {
  ExecutorOptions opt;
  opt.interpreter = "/nonexistent/python3";
  SandboxExecutor executor(opt);
  ExecutionOutcome outcome = executor.Execute("print(1)\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_EQ(outcome.worker_pid, 0);
  EXPECT_THAT(outcome.error_message.value_or(""), HasSubstr("/nonexistent/python3"));
}

TEST(Executor, WorkerWithoutResult) {
  ExecutorOptions opt;
  opt.interpreter = "/bin/true";
  SandboxExecutor executor(opt);
  ExecutionOutcome outcome = executor.Execute("print(1)\n", kTimeout);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_EQ(outcome.error_message, "worker exited without a result (exit status 0)");
  EXPECT_EQ(outcome.exit_code, 0);
  EXPECT_TRUE(IsGone(outcome.worker_pid));
}

TEST(Executor, InvalidTimeout) {
  SandboxExecutor executor;
  ExecutionOutcome outcome = executor.Execute("print(1)\n", 0);
  EXPECT_STATUS(outcome, ExecStatus::CRASHED);
  EXPECT_EQ(outcome.worker_pid, 0);
}

TEST(Executor, ConcurrentNoCrossTalk) {
  constexpr int kWorkers = 50;
  SandboxExecutor executor;
  std::vector<ExecutionOutcome> outcomes(kWorkers);
  std::vector<std::thread> threads;
  for (int i = 0; i < kWorkers; i++) {
    threads.emplace_back([&executor, &outcomes, i]() {
      std::string source =
          "total = 0\n"
          "for n in range(300000):\n"
          "    total += n\n"
          "print(" + std::to_string(i) + ", total)\n";
      outcomes[i] = executor.Execute(source, 60'000'000);
    });
  }
  for (auto& t : threads) t.join();
  for (int i = 0; i < kWorkers; i++) {
    EXPECT_STATUS(outcomes[i], ExecStatus::COMPLETED);
    EXPECT_EQ(outcomes[i].stdout_data, std::to_string(i) + " 44999850000\n");
    EXPECT_TRUE(IsGone(outcomes[i].worker_pid));
  }
  EXPECT_EQ(CountChildren(), 0);
}
