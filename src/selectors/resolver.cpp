#include "healrun/selectors/resolver.hpp"

#include "healrun/common/clock.hpp"
#include "healrun/observability/global.hpp"

#include <algorithm>

namespace healrun::selectors {

SelfHealingResolver::SelfHealingResolver(CandidateStore &store, const SelectorRanker &ranker,
                                         driver::IDriver &driver,
                                         const std::chrono::milliseconds probe_timeout)
    : store_(store), ranker_(ranker), driver_(driver), probe_timeout_(probe_timeout) {}

ResolutionOutcome SelfHealingResolver::resolve(const std::string &descriptor_id,
                                               const common::CancellationToken *token) {
  const auto started = std::chrono::steady_clock::now();
  ResolutionOutcome outcome;
  outcome.descriptor_id = descriptor_id;

  const auto descriptor = store_.snapshot(descriptor_id);
  if (!descriptor.has_value()) {
    observability::record_warning("resolver", "unknown element descriptor: " + descriptor_id);
    return outcome;
  }

  const auto ranked = ranker_.rank(*descriptor, common::unix_time_ms());
  for (std::size_t position = 0; position < ranked.size(); ++position) {
    if (token != nullptr && token->cancelled()) {
      break;
    }
    auto timeout = probe_timeout_;
    if (token != nullptr) {
      timeout = std::min(timeout, token->remaining());
    }

    const std::size_t index = ranked[position].index;
    const auto &candidate = descriptor->candidates[index];
    ++outcome.attempts;
    if (!driver_.exists(candidate.locator, timeout)) {
      continue;
    }

    outcome.candidate_index = index;
    outcome.locator = candidate.locator;
    outcome.status =
        position == 0 ? ResolutionStatus::Resolved : ResolutionStatus::ResolvedWithFallback;

    auto marked = store_.mark_success(descriptor_id, index, common::unix_time_ms());
    if (!marked.ok()) {
      observability::record_warning("resolver", marked.error());
    }
    if (outcome.status == ResolutionStatus::ResolvedWithFallback) {
      observability::record_warning("resolver", descriptor_id + " healed via fallback '" +
                                                    candidate.locator + "' (rank " +
                                                    std::to_string(position + 1) + ")");
    }
    break;
  }

  outcome.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric("resolver.probes", static_cast<double>(outcome.attempts));
  if (outcome.status == ResolutionStatus::Unresolved) {
    observability::record_warning("resolver", descriptor_id + " unresolved after " +
                                                  std::to_string(outcome.attempts) + " probe(s)");
  }
  return outcome;
}

} // namespace healrun::selectors
