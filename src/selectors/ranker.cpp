#include "healrun/selectors/ranker.hpp"

#include "healrun/common/fs.hpp"

#include <algorithm>

namespace healrun::selectors {

namespace {

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

bool is_text_match(const std::string &lowered) {
  return contains(lowered, ":has-text(") || contains(lowered, ":text(") ||
         common::starts_with(lowered, "text=") || contains(lowered, "[value=") ||
         contains(lowered, "[value*=");
}

bool is_exact_id(const std::string &lowered) {
  if (common::starts_with(lowered, "#")) {
    // "#login" but not "#form input:nth-child(2)".
    return lowered.find_first_of(" >~+:[") == std::string::npos;
  }
  return common::starts_with(lowered, "id=") || contains(lowered, "[id=") ||
         contains(lowered, "[data-testid=") || contains(lowered, "[data-test-id=");
}

bool is_name_or_label(const std::string &lowered) {
  return contains(lowered, "[name=") || contains(lowered, "[aria-label=") ||
         contains(lowered, "[placeholder=") || contains(lowered, "[for=") ||
         common::starts_with(lowered, "label=") || common::starts_with(lowered, "name=");
}

bool is_positional(const std::string &lowered) {
  return contains(lowered, ":nth-") || contains(lowered, ":first") || contains(lowered, ":last") ||
         common::starts_with(lowered, "/") || common::starts_with(lowered, "xpath=") ||
         contains(lowered, " > ");
}

} // namespace

std::string_view specificity_name(const LocatorSpecificity specificity) {
  switch (specificity) {
  case LocatorSpecificity::Id:
    return "id";
  case LocatorSpecificity::NameOrLabel:
    return "name-or-label";
  case LocatorSpecificity::Attribute:
    return "attribute";
  case LocatorSpecificity::Structural:
    return "structural";
  }
  return "structural";
}

LocatorSpecificity classify_locator(const std::string &locator, const ElementRole role) {
  const std::string lowered = common::to_lower(common::trim(locator));
  if (is_positional(lowered)) {
    return LocatorSpecificity::Structural;
  }
  if (is_exact_id(lowered)) {
    return LocatorSpecificity::Id;
  }
  if (is_name_or_label(lowered)) {
    return LocatorSpecificity::NameOrLabel;
  }
  if (is_text_match(lowered)) {
    return (role == ElementRole::Button || role == ElementRole::Link)
               ? LocatorSpecificity::NameOrLabel
               : LocatorSpecificity::Attribute;
  }
  if (lowered.find_first_of("[.#") != std::string::npos) {
    return LocatorSpecificity::Attribute;
  }
  return LocatorSpecificity::Structural;
}

double specificity_weight(const LocatorSpecificity specificity) {
  switch (specificity) {
  case LocatorSpecificity::Id:
    return 0.3;
  case LocatorSpecificity::NameOrLabel:
    return 0.2;
  case LocatorSpecificity::Attribute:
    return 0.1;
  case LocatorSpecificity::Structural:
    return 0.0;
  }
  return 0.0;
}

SelectorRanker::SelectorRanker(config::RankerConfig config) : config_(config) {}

double SelectorRanker::recency_bonus(const SelectorCandidate &candidate,
                                     const std::int64_t now_ms) const {
  if (!candidate.last_known_good_ms.has_value()) {
    return 0.0;
  }
  const std::int64_t age = now_ms - *candidate.last_known_good_ms;
  if (age < 0 || static_cast<std::uint64_t>(age) > config_.freshness_window_ms) {
    return 0.0;
  }
  return config_.recency_bonus;
}

std::vector<RankedCandidate> SelectorRanker::rank(const ElementDescriptor &descriptor,
                                                  const std::int64_t now_ms) const {
  std::vector<RankedCandidate> ranked;
  ranked.reserve(descriptor.candidates.size());
  for (std::size_t i = 0; i < descriptor.candidates.size(); ++i) {
    const auto &candidate = descriptor.candidates[i];
    RankedCandidate entry;
    entry.index = i;
    entry.specificity = specificity_weight(classify_locator(candidate.locator, descriptor.role));
    entry.recency = recency_bonus(candidate, now_ms);
    entry.score = candidate.confidence + entry.specificity + entry.recency;
    ranked.push_back(entry);
  }

  std::stable_sort(ranked.begin(), ranked.end(),
                   [](const RankedCandidate &a, const RankedCandidate &b) {
                     return a.score > b.score;
                   });
  return ranked;
}

} // namespace healrun::selectors
