#include "healrun/report/aggregator.hpp"

#include "healrun/common/clock.hpp"
#include "healrun/common/fs.hpp"
#include "healrun/observability/global.hpp"

namespace healrun::report {

std::string_view classification_name(const TestCaseClassification classification) {
  switch (classification) {
  case TestCaseClassification::Pass:
    return "pass";
  case TestCaseClassification::Fail:
    return "fail";
  case TestCaseClassification::Flaky:
    return "flaky";
  }
  return "fail";
}

void FlakinessAggregator::reset() {
  summaries_.clear();
  healing_.clear();
  malformed_ = 0;
  ingested_ = 0;
}

void FlakinessAggregator::ingest(const execution::TestVerdict &verdict) {
  ++ingested_;
  bool malformed = false;

  std::string id = common::trim(verdict.test_case_id);
  if (id.empty()) {
    id = "(unnamed)";
    malformed = true;
  }

  // Trust the actions over the recorded status. A verdict that failed before
  // any action ran (driver setup) carries an error and no actions.
  auto status = execution::derive_verdict_status(verdict.actions);
  if (verdict.actions.empty() && !verdict.error.empty()) {
    status = execution::VerdictStatus::Fail;
  }
  if (status != verdict.status) {
    malformed = true;
  }
  if (malformed) {
    ++malformed_;
    observability::record_warning("aggregator", "normalized malformed verdict for " + id);
  }

  auto &summary = summaries_[id];
  summary.test_case_id = id;
  ++summary.runs;
  switch (status) {
  case execution::VerdictStatus::Pass:
    ++summary.pass_count;
    break;
  case execution::VerdictStatus::Fail:
    ++summary.fail_count;
    break;
  case execution::VerdictStatus::Flaky:
    ++summary.flaky_count;
    break;
  }

  if (status == execution::VerdictStatus::Fail && verdict.actions.empty()) {
    summary.last_failure = execution::FailureKind::ActionError;
    summary.last_error = verdict.error;
    summary.failure_kinds.insert(execution::FailureKind::ActionError);
  }

  for (const auto &action : verdict.actions) {
    if (action.status == execution::ActionStatus::Failed) {
      summary.last_failure = action.failure;
      summary.last_error = action.error;
      if (action.failure != execution::FailureKind::None) {
        summary.failure_kinds.insert(action.failure);
      }
    }
    if (action.evidence_ref.has_value()) {
      summary.evidence_refs.push_back(*action.evidence_ref);
    }
    if (action.evidence_capture_failed) {
      ++summary.evidence_capture_failures;
    }
    if (!action.resolution.has_value()) {
      continue;
    }
    const auto &resolution = *action.resolution;
    auto &stats = healing_[resolution.descriptor_id];
    switch (resolution.status) {
    case selectors::ResolutionStatus::Resolved:
      ++stats.resolved;
      stats.last_winning_locator = resolution.locator;
      break;
    case selectors::ResolutionStatus::ResolvedWithFallback:
      ++stats.resolved_with_fallback;
      stats.last_winning_locator = resolution.locator;
      break;
    case selectors::ResolutionStatus::Unresolved:
      ++stats.unresolved;
      break;
    }
  }
}

SessionReport FlakinessAggregator::finalize(std::vector<driver::DriverCallStats> driver_calls) {
  SessionReport report;
  report.generated_at_ms = common::unix_time_ms();
  report.driver_calls = std::move(driver_calls);

  for (auto &[id, summary] : summaries_) {
    const bool divergent = summary.fail_count > 0 && (summary.pass_count + summary.flaky_count) > 0;
    if (summary.flaky_count > 0 || divergent) {
      summary.classification = TestCaseClassification::Flaky;
    } else if (summary.fail_count > 0) {
      summary.classification = TestCaseClassification::Fail;
    } else {
      summary.classification = TestCaseClassification::Pass;
    }
    summary.flakiness_confirmed = summary.runs >= 2 && divergent;

    report.totals.runs += summary.runs;
    report.totals.passed += summary.pass_count;
    report.totals.failed += summary.fail_count;
    report.totals.flaky_runs += summary.flaky_count;
    if (summary.classification == TestCaseClassification::Flaky) {
      ++report.totals.flaky_test_cases;
    }
  }
  report.totals.test_cases = static_cast<std::uint32_t>(summaries_.size());
  report.totals.malformed_verdicts = malformed_;
  report.test_cases = std::move(summaries_);
  report.healing = std::move(healing_);
  reset();
  return report;
}

} // namespace healrun::report
