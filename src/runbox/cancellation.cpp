#include <runbox/cancellation.h>

#include <spdlog/spdlog.h>

// Logging happens after the lock is released; the producer loop polls
//  IsCancelled for every unit and must never wait behind console output.

void CancellationRegistry::Begin(const std::string& request_id) {
  std::string replaced;
  {
    std::lock_guard<std::mutex> lck(lock_);
    if (active_) replaced = active_id_;
    active_id_ = request_id;
    active_ = true;
    cancelled_ = false;
  }
  if (!replaced.empty()) {
    spdlog::warn("Session {} replaced by {} before it ended", replaced, request_id);
  }
  spdlog::info("Session started: id={}", request_id);
}

bool CancellationRegistry::IsCancelled(const std::string& request_id) const {
  std::lock_guard<std::mutex> lck(lock_);
  return active_ && cancelled_ && active_id_ == request_id;
}

AbortResult CancellationRegistry::Abort(const std::string& request_id) {
  AbortResult ret = {true, ""};
  {
    std::lock_guard<std::mutex> lck(lock_);
    if (!active_) {
      // also the case of an abort arriving after its session already ended
      ret = {false, "no active session"};
    } else if (active_id_ != request_id) {
      ret = {false, "request id does not match the active session"};
    } else {
      cancelled_ = true;
    }
  }
  if (ret.success) {
    spdlog::info("Session abort requested: id={}", request_id);
  } else {
    spdlog::info("Abort ignored: id={} reason={}", request_id, ret.error);
  }
  return ret;
}

SessionOutcome CancellationRegistry::End(const std::string& request_id, SessionOutcome outcome) {
  {
    std::lock_guard<std::mutex> lck(lock_);
    if (!active_ || active_id_ != request_id) {
      outcome = SessionOutcome::NONE;
    } else {
      if (cancelled_) {
        outcome = SessionOutcome::ABORTED;
      } else if (outcome == SessionOutcome::NONE || outcome == SessionOutcome::ABORTED) {
        // ABORTED is decided by the flag alone
        outcome = SessionOutcome::COMPLETED;
      }
      last_id_ = request_id;
      last_outcome_ = outcome;
      active_id_.clear();
      active_ = false;
      cancelled_ = false;
    }
  }
  if (outcome == SessionOutcome::NONE) {
    spdlog::warn("Stale session end ignored: id={}", request_id);
  } else {
    spdlog::info("Session ended: id={} outcome={}", request_id, SessionOutcomeName(outcome));
  }
  return outcome;
}

SessionState CancellationRegistry::State() const {
  std::lock_guard<std::mutex> lck(lock_);
  return active_ ? SessionState::ACTIVE : SessionState::IDLE;
}

std::string CancellationRegistry::ActiveRequest() const {
  std::lock_guard<std::mutex> lck(lock_);
  return active_id_;
}

std::pair<std::string, SessionOutcome> CancellationRegistry::LastOutcome() const {
  std::lock_guard<std::mutex> lck(lock_);
  return {last_id_, last_outcome_};
}

CancellationRegistry& GlobalCancellationRegistry() {
  static CancellationRegistry registry;
  return registry;
}
