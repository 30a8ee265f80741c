#include "healrun/execution/session.hpp"

#include "healrun/common/cancellation.hpp"
#include "healrun/execution/executor.hpp"
#include "healrun/observability/global.hpp"
#include "healrun/selectors/ranker.hpp"
#include "healrun/selectors/resolver.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <limits>
#include <memory>

namespace healrun::execution {

SessionOrchestrator::SessionOrchestrator(const config::Config &config,
                                         selectors::CandidateStore &store,
                                         driver::IDriver &driver)
    : config_(config), store_(store), driver_(driver) {}

TestVerdict SessionOrchestrator::run(const TestCase &test_case, const std::uint32_t run_index) {
  const auto started = std::chrono::steady_clock::now();
  TestVerdict verdict;
  verdict.test_case_id = test_case.id;
  verdict.run_index = run_index;

  // A deadline of zero means the test case may run unbounded.
  std::unique_ptr<common::CancellationToken> token;
  if (config_.execution.per_test_case_deadline_ms > 0) {
    const auto budget = std::min<std::uint64_t>(config_.execution.per_test_case_deadline_ms,
                                                std::numeric_limits<std::int64_t>::max());
    token = std::make_unique<common::CancellationToken>(
        std::chrono::milliseconds(static_cast<std::int64_t>(budget)));
  } else {
    token = std::make_unique<common::CancellationToken>();
  }

  const selectors::SelectorRanker ranker(config_.ranker);
  selectors::SelfHealingResolver resolver(
      store_, ranker, driver_,
      std::chrono::milliseconds(config_.resolver.existence_probe_timeout_ms));
  ActionExecutor executor(driver_, resolver, RetryPolicy::from_config(config_.retry),
                          std::chrono::milliseconds(config_.execution.post_action_settle_ms));

  for (const auto &step : test_case.steps) {
    verdict.actions.push_back(executor.execute(step, *token));
    if (verdict.actions.back().status == ActionStatus::Failed) {
      const auto remaining = test_case.steps.size() - verdict.actions.size();
      if (remaining > 0) {
        observability::record_info("orchestrator", test_case.id + ": skipping " +
                                                       std::to_string(remaining) +
                                                       " remaining step(s)");
      }
      break;
    }
  }

  verdict.status = derive_verdict_status(verdict.actions);
  verdict.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_info("orchestrator",
                             test_case.id + " run " + std::to_string(run_index) + ": " +
                                 std::string(verdict_status_name(verdict.status)) + " in " +
                                 std::to_string(verdict.duration.count()) + "ms");
  return verdict;
}

} // namespace healrun::execution
