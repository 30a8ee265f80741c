#pragma once

#include "healrun/common/cancellation.hpp"
#include "healrun/driver/driver.hpp"
#include "healrun/selectors/candidate_store.hpp"
#include "healrun/selectors/ranker.hpp"
#include "healrun/selectors/types.hpp"

#include <chrono>
#include <string>

namespace healrun::selectors {

/// Probes a descriptor's ranked candidates against the live page, one
/// existence check per candidate, and returns the first that matches.
/// Retrying is left to the caller.
class SelfHealingResolver {
public:
  SelfHealingResolver(CandidateStore &store, const SelectorRanker &ranker,
                      driver::IDriver &driver, std::chrono::milliseconds probe_timeout);

  /// Stops probing early once `token` fires; the outcome is then unresolved.
  [[nodiscard]] ResolutionOutcome resolve(const std::string &descriptor_id,
                                          const common::CancellationToken *token = nullptr);

private:
  CandidateStore &store_;
  const SelectorRanker &ranker_;
  driver::IDriver &driver_;
  std::chrono::milliseconds probe_timeout_;
};

} // namespace healrun::selectors
