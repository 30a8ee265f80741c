#pragma once

#include "healrun/config/config.hpp"
#include "healrun/selectors/types.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace healrun::selectors {

enum class LocatorSpecificity { Id, NameOrLabel, Attribute, Structural };

[[nodiscard]] std::string_view specificity_name(LocatorSpecificity specificity);

/// Classify a locator expression for `role`. Text matches count as labels for
/// buttons and links but only as attributes for form fields.
[[nodiscard]] LocatorSpecificity classify_locator(const std::string &locator, ElementRole role);

[[nodiscard]] double specificity_weight(LocatorSpecificity specificity);

struct RankedCandidate {
  std::size_t index = 0;
  double score = 0.0;
  double specificity = 0.0;
  double recency = 0.0;
};

class SelectorRanker {
public:
  explicit SelectorRanker(config::RankerConfig config);

  /// Candidates ordered by descending composite score, ties kept in
  /// declaration order. Pure; `now_ms` is the reference for freshness.
  [[nodiscard]] std::vector<RankedCandidate> rank(const ElementDescriptor &descriptor,
                                                  std::int64_t now_ms) const;

  [[nodiscard]] double recency_bonus(const SelectorCandidate &candidate,
                                     std::int64_t now_ms) const;

private:
  config::RankerConfig config_;
};

} // namespace healrun::selectors
