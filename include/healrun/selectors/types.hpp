#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace healrun::selectors {

enum class ElementRole { Input, Button, Link, Checkbox, Custom };

[[nodiscard]] std::string_view role_name(ElementRole role);
/// Unknown or empty names map to ElementRole::Custom.
[[nodiscard]] ElementRole parse_role(const std::string &name);

struct SelectorCandidate {
  std::string locator;
  double confidence = 0.0;
  std::optional<std::int64_t> last_known_good_ms;
};

struct ElementDescriptor {
  std::string id;
  ElementRole role = ElementRole::Custom;
  std::vector<SelectorCandidate> candidates;
  /// Name of a universal fallback pool appended on admission, if any.
  std::string fallback_pool;
};

enum class ResolutionStatus { Resolved, ResolvedWithFallback, Unresolved };

[[nodiscard]] std::string_view resolution_status_name(ResolutionStatus status);

struct ResolutionOutcome {
  std::string descriptor_id;
  ResolutionStatus status = ResolutionStatus::Unresolved;
  /// Index into the descriptor's own candidate list.
  std::optional<std::size_t> candidate_index;
  std::string locator;
  std::size_t attempts = 0;
  std::chrono::milliseconds elapsed{0};
};

} // namespace healrun::selectors
