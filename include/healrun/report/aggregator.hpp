#pragma once

#include "healrun/driver/profiler.hpp"
#include "healrun/execution/types.hpp"

#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace healrun::report {

enum class TestCaseClassification { Pass, Fail, Flaky };

[[nodiscard]] std::string_view classification_name(TestCaseClassification classification);

struct TestCaseSummary {
  std::string test_case_id;
  std::uint32_t runs = 0;
  std::uint32_t pass_count = 0;
  std::uint32_t fail_count = 0;
  std::uint32_t flaky_count = 0;
  TestCaseClassification classification = TestCaseClassification::Pass;
  /// At least two runs that disagreed with each other.
  bool flakiness_confirmed = false;
  /// Failure kind of the most recent failed action, if any run failed.
  execution::FailureKind last_failure = execution::FailureKind::None;
  std::string last_error;
  /// Every distinct failure kind seen across runs.
  std::set<execution::FailureKind> failure_kinds;
  std::vector<std::string> evidence_refs;
  std::uint32_t evidence_capture_failures = 0;
};

struct HealingStats {
  std::uint32_t resolved = 0;
  std::uint32_t resolved_with_fallback = 0;
  std::uint32_t unresolved = 0;
  std::string last_winning_locator;
};

struct ReportTotals {
  std::uint32_t test_cases = 0;
  std::uint32_t runs = 0;
  std::uint32_t passed = 0;
  std::uint32_t failed = 0;
  std::uint32_t flaky_runs = 0;
  std::uint32_t flaky_test_cases = 0;
  std::uint32_t malformed_verdicts = 0;
};

struct SessionReport {
  std::map<std::string, TestCaseSummary> test_cases;
  std::map<std::string, HealingStats> healing;
  std::vector<driver::DriverCallStats> driver_calls;
  ReportTotals totals;
  std::int64_t generated_at_ms = 0;
};

/// Folds a stream of verdicts, possibly several per test case, into one
/// SessionReport. State lives from reset() to finalize().
class FlakinessAggregator {
public:
  void reset();

  /// Never rejects a verdict. Verdicts whose status disagrees with their
  /// actions, or that carry no id, are normalized and counted as malformed.
  void ingest(const execution::TestVerdict &verdict);

  [[nodiscard]] SessionReport finalize(std::vector<driver::DriverCallStats> driver_calls = {});

  [[nodiscard]] std::size_t ingested() const { return ingested_; }

private:
  std::map<std::string, TestCaseSummary> summaries_;
  std::map<std::string, HealingStats> healing_;
  std::uint32_t malformed_ = 0;
  std::size_t ingested_ = 0;
};

} // namespace healrun::report
