#pragma once

#include "healrun/common/result.hpp"
#include "healrun/config/config.hpp"
#include "healrun/driver/driver.hpp"
#include "healrun/driver/profiler.hpp"
#include "healrun/execution/types.hpp"
#include "healrun/report/aggregator.hpp"
#include "healrun/selectors/candidate_store.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace healrun::execution {

/// Opens an independent browser session for the named test case.
using DriverFactory =
    std::function<common::Result<std::unique_ptr<driver::IDriver>>(const std::string &test_case_id)>;

/// Runs a suite of test cases on a bounded pool of worker threads and folds
/// every verdict into a SessionReport. Each test case owns its driver and,
/// unless disabled in config, its own copy of the candidate store.
class SuiteRunner {
public:
  SuiteRunner(const config::Config &config, DriverFactory factory);

  [[nodiscard]] report::SessionReport run(const std::vector<TestCase> &test_cases,
                                          selectors::CandidateStore &store);

  /// All verdicts from the last run(), in submission order.
  [[nodiscard]] const std::vector<TestVerdict> &verdicts() const { return verdicts_; }

  [[nodiscard]] driver::DriverProfiler &profiler() { return profiler_; }

private:
  std::vector<TestVerdict> run_test_case(const TestCase &test_case,
                                         selectors::CandidateStore &shared_store);

  const config::Config &config_;
  DriverFactory factory_;
  driver::DriverProfiler profiler_;
  std::vector<TestVerdict> verdicts_;
};

} // namespace healrun::execution
