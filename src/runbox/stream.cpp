#include <runbox/stream.h>

#include <exception>

#include <spdlog/spdlog.h>

StreamResult RunStream(CancellationRegistry& registry, const std::string& request_id,
                       const std::function<std::optional<std::string>()>& next,
                       const std::function<void(const std::string&)>& emit) {
  StreamResult ret = {SessionOutcome::NONE, 0, ""};
  SessionOutcome outcome = SessionOutcome::COMPLETED;
  registry.Begin(request_id);
  try {
    while (!registry.IsCancelled(request_id)) {
      std::optional<std::string> unit = next();
      if (!unit) break;
      emit(*unit);
      ret.units++;
    }
  } catch (const std::exception& e) {
    spdlog::warn("Stream producer failed: id={} units={} error={}", request_id, ret.units, e.what());
    outcome = SessionOutcome::ERRORED;
    ret.error = e.what();
  } catch (...) {
    registry.End(request_id, SessionOutcome::ERRORED);
    throw;
  }
  ret.outcome = registry.End(request_id, outcome);
  spdlog::debug("Stream finished: id={} units={} outcome={}",
                request_id, ret.units, SessionOutcomeName(ret.outcome));
  return ret;
}
