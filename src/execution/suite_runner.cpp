#include "healrun/execution/suite_runner.hpp"

#include "healrun/execution/session.hpp"
#include "healrun/observability/global.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <exception>
#include <thread>

namespace healrun::execution {

namespace {

TestVerdict setup_failure(const std::string &test_case_id, const std::string &error) {
  TestVerdict verdict;
  verdict.test_case_id = test_case_id;
  verdict.status = VerdictStatus::Fail;
  verdict.error = error;
  return verdict;
}

} // namespace

SuiteRunner::SuiteRunner(const config::Config &config, DriverFactory factory)
    : config_(config), factory_(std::move(factory)) {}

std::vector<TestVerdict> SuiteRunner::run_test_case(const TestCase &test_case,
                                                    selectors::CandidateStore &shared_store) {
  std::vector<TestVerdict> out;

  auto opened = factory_ ? factory_(test_case.id)
                         : common::Result<std::unique_ptr<driver::IDriver>>::failure(
                               "no driver factory configured");
  if (!opened.ok() || opened.value() == nullptr) {
    const std::string error =
        "driver setup failed: " + (opened.ok() ? std::string("null driver") : opened.error());
    observability::record_error("suite", test_case.id + ": " + error);
    out.push_back(setup_failure(test_case.id, error));
    return out;
  }
  std::unique_ptr<driver::IDriver> inner = std::move(opened.value());
  driver::ProfilingDriver driver(*inner, profiler_);

  std::unique_ptr<selectors::CandidateStore> own_store;
  if (config_.execution.isolate_candidate_stores) {
    own_store = std::make_unique<selectors::CandidateStore>(shared_store);
  }
  selectors::CandidateStore &store = own_store ? *own_store : shared_store;

  SessionOrchestrator orchestrator(config_, store, driver);
  const std::uint32_t runs = std::max<std::uint32_t>(1, config_.replay.runs);
  for (std::uint32_t run = 0; run < runs; ++run) {
    out.push_back(orchestrator.run(test_case, run));
  }
  if (config_.replay.rerun_failed && out.back().status == VerdictStatus::Fail) {
    observability::record_info("suite", test_case.id + ": re-running failed test case");
    out.push_back(orchestrator.run(test_case, runs));
  }
  return out;
}

report::SessionReport SuiteRunner::run(const std::vector<TestCase> &test_cases,
                                       selectors::CandidateStore &store) {
  const auto started = std::chrono::steady_clock::now();
  verdicts_.clear();
  profiler_.reset();

  std::vector<std::vector<TestVerdict>> slots(test_cases.size());
  std::atomic<std::size_t> next{0};

  auto worker = [&]() {
    while (true) {
      const std::size_t index = next.fetch_add(1);
      if (index >= test_cases.size()) {
        return;
      }
      const auto &test_case = test_cases[index];
      try {
        slots[index] = run_test_case(test_case, store);
      } catch (const std::exception &e) {
        observability::record_error("suite", test_case.id + ": " + e.what());
        slots[index].push_back(setup_failure(test_case.id, std::string("driver error: ") + e.what()));
      }
    }
  };

  const std::size_t width = std::min<std::size_t>(
      std::max<std::uint32_t>(1, config_.execution.max_concurrent_test_cases), test_cases.size());
  std::vector<std::thread> threads;
  threads.reserve(width);
  for (std::size_t i = 0; i < width; ++i) {
    threads.emplace_back(worker);
  }
  for (auto &thread : threads) {
    if (thread.joinable()) {
      thread.join();
    }
  }

  report::FlakinessAggregator aggregator;
  aggregator.reset();
  for (auto &slot : slots) {
    for (auto &verdict : slot) {
      aggregator.ingest(verdict);
      verdicts_.push_back(std::move(verdict));
    }
  }
  auto report = aggregator.finalize(profiler_.all_stats());

  const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric("suite.duration_ms", static_cast<double>(elapsed.count()));
  observability::record_info("suite", std::to_string(report.totals.test_cases) + " test case(s), " +
                                          std::to_string(report.totals.failed) + " failed run(s), " +
                                          std::to_string(report.totals.flaky_test_cases) +
                                          " flaky");
  return report;
}

} // namespace healrun::execution
