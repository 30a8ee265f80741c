#pragma once

#include "healrun/common/result.hpp"
#include "healrun/selectors/fallback_pools.hpp"
#include "healrun/selectors/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace healrun::selectors {

/// Owns the element descriptors for one engine invocation. Candidates are
/// never removed; the only mutation after admission is the last-known-good
/// timestamp, which only moves forward so concurrent updates commute.
class CandidateStore {
public:
  CandidateStore() = default;
  explicit CandidateStore(std::vector<FallbackPool> pools);

  /// Snapshot copy; the copy shares nothing with `other` afterwards.
  CandidateStore(const CandidateStore &other);
  CandidateStore &operator=(const CandidateStore &) = delete;

  /// Admit a descriptor, appending its fallback pool's locators that are
  /// not already declared. Rejects empty and duplicate ids.
  [[nodiscard]] common::Status add(ElementDescriptor descriptor);

  [[nodiscard]] bool contains(const std::string &id) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::vector<std::string> ids() const;

  [[nodiscard]] std::optional<ElementDescriptor> snapshot(const std::string &id) const;

  /// Record that candidate `index` of descriptor `id` matched at `timestamp_ms`.
  [[nodiscard]] common::Status mark_success(const std::string &id, std::size_t index,
                                            std::int64_t timestamp_ms);

private:
  std::vector<FallbackPool> pools_;
  std::unordered_map<std::string, ElementDescriptor> descriptors_;
  std::vector<std::string> order_;
  mutable std::mutex mutex_;
};

} // namespace healrun::selectors
