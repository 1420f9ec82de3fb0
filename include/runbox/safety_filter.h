#ifndef INCLUDE_RUNBOX_SAFETY_FILTER_H_
#define INCLUDE_RUNBOX_SAFETY_FILTER_H_

#include <string>
#include <vector>
#include <utility>
#include <optional>

extern const std::vector<std::string> kDefaultDenylist;

// Plain substring scan; no tokenizing. A denylisted word inside a comment or a
// string literal is rejected too, while the same call reached indirectly is not.
class SafetyFilter {
  std::vector<std::string> denylist_;
 public:
  SafetyFilter() : denylist_(kDefaultDenylist) {}
  explicit SafetyFilter(std::vector<std::string> denylist) : denylist_(std::move(denylist)) {}

  // return the first denylist entry (in denylist order) found in source
  std::optional<std::string> Check(const std::string& source) const;
  const std::vector<std::string>& Denylist() const { return denylist_; }
};

#endif  // INCLUDE_RUNBOX_SAFETY_FILTER_H_
