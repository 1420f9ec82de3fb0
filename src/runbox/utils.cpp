#include "utils.h"

#include <sys/resource.h>
#include <sys/syscall.h>

#include <runbox/outcome.h>
#include <runbox/cancellation.h>

#define ENUM_SWITCH_FUNCTION(DEF, typ, mac) \
  DEF(typ param) { \
    switch (param) { \
      mac \
    } \
    __builtin_unreachable(); \
  }
#define X_RETURN_ARG1(cls, x, ...) case cls::x: return #x;
#define X_RETURN_ARG2(cls, x, y, ...) case cls::x: return y;

#define X(...) X_RETURN_ARG2(ExecStatus, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* ExecStatusName, ExecStatus, ENUM_EXEC_STATUS_)
#undef X

#define X(...) X_RETURN_ARG1(SessionState, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SessionStateName, SessionState, ENUM_SESSION_STATE_)
#undef X

#define X(...) X_RETURN_ARG1(SessionOutcome, __VA_ARGS__)
ENUM_SWITCH_FUNCTION(const char* SessionOutcomeName, SessionOutcome, ENUM_SESSION_OUTCOME_)
#undef X

#undef ENUM_SWITCH_FUNCTION
#undef X_RETURN_ARG1
#undef X_RETURN_ARG2

int CloseFrom(int minfd) {
#ifdef SYS_close_range
  if (syscall(SYS_close_range, minfd, ~0U, 0) == 0) return 0;
#endif
  // kernel older than 5.9
  struct rlimit lim;
  if (getrlimit(RLIMIT_NOFILE, &lim) < 0) return -1;
  rlim_t top = lim.rlim_cur == RLIM_INFINITY ? 65536 : lim.rlim_cur;
  for (rlim_t fd = minfd; fd < top; fd++) close(fd);
  return 0;
}
