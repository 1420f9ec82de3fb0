#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <sys/types.h>
#include <string>

#include <gtest/gtest.h>
#include <runbox/outcome.h>

// children of this process in any state, zombies included
int CountChildren();

// true once pid is neither running nor waiting to be reaped by us
bool IsGone(pid_t pid);

// true if pid, not necessarily our child, has terminated (zombies included);
// waits up to timeout_ms for it
bool Terminated(pid_t pid, int timeout_ms);

inline std::ostream& operator<<(std::ostream& os, ExecStatus status) {
  return os << ExecStatusName(status);
}

#define EXPECT_STATUS(outcome, expected) \
  EXPECT_EQ((outcome).status, (expected)) \
      << "error_message: " << (outcome).error_message.value_or("") \
      << "\nstderr: " << (outcome).stderr_data

#endif  // TEST_UTILS_H_
