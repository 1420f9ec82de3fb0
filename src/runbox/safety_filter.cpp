#include <runbox/safety_filter.h>

const std::vector<std::string> kDefaultDenylist = {
  "eval", "exec", "__import__", "open",
  "getattr", "setattr", "delattr", "compile",
  "globals", "locals", "vars",
  "system", "popen", "spawn", "fork", "kill",
};

std::optional<std::string> SafetyFilter::Check(const std::string& source) const {
  for (auto& token : denylist_) {
    if (token.empty()) continue;
    if (source.find(token) != std::string::npos) return token;
  }
  return std::nullopt;
}
