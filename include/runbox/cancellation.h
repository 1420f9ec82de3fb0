#ifndef INCLUDE_RUNBOX_CANCELLATION_H_
#define INCLUDE_RUNBOX_CANCELLATION_H_

#include <mutex>
#include <string>
#include <utility>

#define ENUM_SESSION_STATE_ \
  X(IDLE) \
  X(ACTIVE)
enum class SessionState {
#define X(name) name,
  ENUM_SESSION_STATE_
#undef X
};

#define ENUM_SESSION_OUTCOME_ \
  X(NONE) /* no session has ended yet, or End was stale */ \
  X(COMPLETED) \
  X(ERRORED) \
  X(ABORTED)
enum class SessionOutcome {
#define X(name) name,
  ENUM_SESSION_OUTCOME_
#undef X
};

struct AbortResult {
  bool success;
  std::string error;
};

// Tracks exactly one active streaming session. A second Begin replaces the
// first session, so an Abort meant for the first one can hit the second.
// All members are thread-safe; the producer loop polls IsCancelled between
// emitted units, so cancellation takes effect within one unit.
class CancellationRegistry {
  mutable std::mutex lock_;
  std::string active_id_;
  bool active_;
  bool cancelled_;
  std::string last_id_;
  SessionOutcome last_outcome_;
 public:
  CancellationRegistry() : active_(false), cancelled_(false), last_outcome_(SessionOutcome::NONE) {}
  CancellationRegistry(const CancellationRegistry&) = delete;
  CancellationRegistry& operator=(const CancellationRegistry&) = delete;

  void Begin(const std::string& request_id);
  bool IsCancelled(const std::string& request_id) const;
  // no-op (success = false) unless request_id is the active session
  AbortResult Abort(const std::string& request_id);
  // Records the terminal outcome (ABORTED if cancelled, otherwise `outcome`)
  // and returns to idle. Returns NONE without touching the state if
  // request_id is not the active session.
  SessionOutcome End(const std::string& request_id, SessionOutcome outcome = SessionOutcome::COMPLETED);

  SessionState State() const;
  std::string ActiveRequest() const; // empty if idle
  std::pair<std::string, SessionOutcome> LastOutcome() const;
};

// process-wide instance
CancellationRegistry& GlobalCancellationRegistry();

const char* SessionStateName(SessionState);
const char* SessionOutcomeName(SessionOutcome);

#endif  // INCLUDE_RUNBOX_CANCELLATION_H_
