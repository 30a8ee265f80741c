#include "test_framework.hpp"

#include "healrun/common/digest.hpp"
#include "healrun/common/json_util.hpp"
#include "healrun/report/aggregator.hpp"
#include "healrun/report/report_writer.hpp"

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>
#include <string>
#include <vector>

namespace {

namespace exec = healrun::execution;
namespace rep = healrun::report;

class TempDir {
public:
  explicit TempDir(const std::string &prefix) {
    static std::mt19937_64 rng{std::random_device{}()};
    path_ = std::filesystem::temp_directory_path() / (prefix + std::to_string(rng()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

exec::ActionResult action(exec::ActionStatus status,
                          exec::FailureKind failure = exec::FailureKind::None) {
  exec::ActionResult result;
  result.kind = exec::ActionKind::Click;
  result.target = "checkout.pay";
  result.status = status;
  result.failure = failure;
  if (status == exec::ActionStatus::Failed) {
    result.error = "no candidate for checkout.pay matched the live page";
    result.evidence_ref = "evidence-1.png";
  }
  return result;
}

exec::TestVerdict verdict(const std::string &id, std::vector<exec::ActionResult> actions,
                          std::uint32_t run_index = 0) {
  exec::TestVerdict out;
  out.test_case_id = id;
  out.run_index = run_index;
  out.actions = std::move(actions);
  out.status = exec::derive_verdict_status(out.actions);
  return out;
}

exec::ActionResult resolved_action(const std::string &descriptor,
                                   healrun::selectors::ResolutionStatus status,
                                   const std::string &locator) {
  auto result = action(status == healrun::selectors::ResolutionStatus::Unresolved
                           ? exec::ActionStatus::Failed
                           : exec::ActionStatus::Success,
                       status == healrun::selectors::ResolutionStatus::Unresolved
                           ? exec::FailureKind::ResolutionTimeout
                           : exec::FailureKind::None);
  healrun::selectors::ResolutionOutcome outcome;
  outcome.descriptor_id = descriptor;
  outcome.status = status;
  outcome.locator = locator;
  result.resolution = outcome;
  return result;
}

} // namespace

void register_report_tests(std::vector<healrun::tests::TestCase> &tests) {
  using healrun::tests::require;

  tests.push_back({"report_pass_then_fail_is_confirmed_flaky", [] {
    rep::FlakinessAggregator aggregator;
    aggregator.reset();
    aggregator.ingest(verdict("checkout-flow", {action(exec::ActionStatus::Success)}, 0));
    aggregator.ingest(verdict("checkout-flow",
                              {action(exec::ActionStatus::Failed,
                                      exec::FailureKind::ResolutionTimeout)},
                              1));
    const auto report = aggregator.finalize();
    const auto &summary = report.test_cases.at("checkout-flow");
    require(summary.runs == 2, "two runs expected");
    require(summary.pass_count == 1 && summary.fail_count == 1, "counts mismatch");
    require(summary.classification == rep::TestCaseClassification::Flaky, "expected flaky");
    require(summary.flakiness_confirmed, "divergence should be confirmed");
    require(summary.last_failure == exec::FailureKind::ResolutionTimeout, "failure kind lost");
    require(summary.evidence_refs.size() == 1, "evidence reference lost");
    require(report.totals.flaky_test_cases == 1, "flaky total mismatch");
  }});

  tests.push_back({"report_single_retried_run_is_unconfirmed_flaky", [] {
    rep::FlakinessAggregator aggregator;
    aggregator.ingest(verdict("search", {action(exec::ActionStatus::RetriedSuccess)}));
    const auto report = aggregator.finalize();
    const auto &summary = report.test_cases.at("search");
    require(summary.classification == rep::TestCaseClassification::Flaky, "expected flaky");
    require(!summary.flakiness_confirmed, "a single run cannot confirm flakiness");
    require(report.totals.flaky_runs == 1, "flaky run not counted");
  }});

  tests.push_back({"report_consistent_outcomes", [] {
    rep::FlakinessAggregator aggregator;
    for (std::uint32_t run = 0; run < 3; ++run) {
      aggregator.ingest(verdict("always-fails",
                                {action(exec::ActionStatus::Failed, exec::FailureKind::ActionError)},
                                run));
      aggregator.ingest(verdict("always-passes", {action(exec::ActionStatus::Success)}, run));
    }
    const auto report = aggregator.finalize();
    require(report.test_cases.at("always-fails").classification ==
                rep::TestCaseClassification::Fail,
            "consistent failure is not flaky");
    require(report.test_cases.at("always-passes").classification ==
                rep::TestCaseClassification::Pass,
            "consistent pass expected");
    require(report.totals.runs == 6 && report.totals.failed == 3 && report.totals.passed == 3,
            "totals mismatch");
    require(report.totals.flaky_test_cases == 0, "nothing should be flaky");
  }});

  tests.push_back({"report_keeps_every_failure_kind", [] {
    rep::FlakinessAggregator aggregator;
    aggregator.ingest(verdict("checkout",
                              {action(exec::ActionStatus::Failed,
                                      exec::FailureKind::ResolutionTimeout)},
                              0));
    aggregator.ingest(verdict("checkout",
                              {action(exec::ActionStatus::Failed, exec::FailureKind::ActionError)},
                              1));
    exec::TestVerdict setup;
    setup.test_case_id = "login";
    setup.status = exec::VerdictStatus::Fail;
    setup.error = "driver setup failed: no browser";
    aggregator.ingest(setup);

    const auto report = aggregator.finalize();
    const auto &kinds = report.test_cases.at("checkout").failure_kinds;
    require(kinds.size() == 2, "both failure kinds should be kept");
    require(kinds.count(exec::FailureKind::ResolutionTimeout) == 1, "resolution-timeout lost");
    require(kinds.count(exec::FailureKind::ActionError) == 1, "action-error lost");
    require(report.test_cases.at("login").failure_kinds.count(exec::FailureKind::ActionError) == 1,
            "setup failure should count as action-error");

    const std::string body = rep::render_report_body(report);
    const auto cases = healrun::common::json_split_top_level_objects(
        healrun::common::json_get_array(body, "test_cases"));
    require(cases.size() == 2, "two test cases expected");
    const std::string checkout_kinds = healrun::common::json_get_array(cases[0], "failure_kinds");
    require(checkout_kinds.find("\"resolution-timeout\"") != std::string::npos &&
                checkout_kinds.find("\"action-error\"") != std::string::npos,
            "failure_kinds array incomplete");

    const std::string text = rep::format_report_text(report);
    require(text.find("failure kinds:") != std::string::npos, "text summary lacks failure kinds");
  }});

  tests.push_back({"report_malformed_verdicts_are_normalized", [] {
    rep::FlakinessAggregator aggregator;
    auto lying = verdict("login", {action(exec::ActionStatus::Failed, exec::FailureKind::ActionError)});
    lying.status = exec::VerdictStatus::Pass;
    aggregator.ingest(lying);
    aggregator.ingest(verdict("", {action(exec::ActionStatus::Success)}));
    aggregator.ingest(verdict("healthy", {action(exec::ActionStatus::Success)}));

    const auto report = aggregator.finalize();
    require(report.totals.malformed_verdicts == 2, "malformed verdicts not counted");
    require(report.test_cases.at("login").fail_count == 1, "status should follow the actions");
    require(report.test_cases.count("(unnamed)") == 1, "unnamed verdict should still be kept");
    require(report.test_cases.at("healthy").classification == rep::TestCaseClassification::Pass,
            "well-formed verdicts unaffected");
  }});

  tests.push_back({"report_healing_statistics", [] {
    using healrun::selectors::ResolutionStatus;
    rep::FlakinessAggregator aggregator;
    aggregator.ingest(verdict("login", {resolved_action("login.submit", ResolutionStatus::Resolved,
                                                        "#submit")}));
    aggregator.ingest(verdict("login", {resolved_action("login.submit",
                                                        ResolutionStatus::ResolvedWithFallback,
                                                        "#login-submit")}));
    aggregator.ingest(verdict("login", {resolved_action("login.submit",
                                                        ResolutionStatus::Unresolved, "")}));
    const auto report = aggregator.finalize();
    const auto &stats = report.healing.at("login.submit");
    require(stats.resolved == 1 && stats.resolved_with_fallback == 1 && stats.unresolved == 1,
            "healing counts mismatch");
    require(stats.last_winning_locator == "#login-submit", "last winner mismatch");
  }});

  tests.push_back({"report_finalize_resets_state", [] {
    rep::FlakinessAggregator aggregator;
    aggregator.ingest(verdict("a", {action(exec::ActionStatus::Success)}));
    require(aggregator.ingested() == 1, "ingest count mismatch");
    (void)aggregator.finalize();
    require(aggregator.ingested() == 0, "finalize should reset");
    const auto empty = aggregator.finalize();
    require(empty.test_cases.empty() && empty.totals.runs == 0, "state leaked between sessions");
  }});

  tests.push_back({"report_json_carries_digest_of_body", [] {
    rep::FlakinessAggregator aggregator;
    aggregator.ingest(verdict("checkout-flow", {action(exec::ActionStatus::Success)}, 0));
    aggregator.ingest(verdict("checkout-flow",
                              {action(exec::ActionStatus::Failed,
                                      exec::FailureKind::ResolutionTimeout)},
                              1));
    healrun::driver::DriverCallStats clicks;
    clicks.method = "click";
    clicks.call_count = 3;
    clicks.success_count = 2;
    clicks.failure_count = 1;
    const auto report = aggregator.finalize({clicks});

    const auto json = rep::render_report_json(report);
    require(json.ok(), "render failed");
    const std::string digest = healrun::common::json_get_string(json.value(), "digest");
    const std::string body = healrun::common::json_get_object(json.value(), "report");
    require(body == rep::render_report_body(report), "body mismatch");
    require(digest == healrun::common::sha256_hex(body).value(), "digest mismatch");

    require(healrun::common::json_get_string(
                healrun::common::json_split_top_level_objects(
                    healrun::common::json_get_array(body, "test_cases"))[0],
                "classification") == "flaky",
            "classification missing");
    require(body.find("\"resolution-timeout\"") != std::string::npos, "failure kind missing");
    require(body.find("\"method\":\"click\"") != std::string::npos, "driver stats missing");
  }});

  tests.push_back({"report_text_summary", [] {
    rep::FlakinessAggregator aggregator;
    aggregator.ingest(verdict("checkout-flow", {action(exec::ActionStatus::Success)}, 0));
    aggregator.ingest(verdict("checkout-flow",
                              {action(exec::ActionStatus::Failed,
                                      exec::FailureKind::ResolutionTimeout)},
                              1));
    const std::string text = rep::format_report_text(aggregator.finalize());
    require(text.find("checkout-flow") != std::string::npos, "test case missing");
    require(text.find("flaky") != std::string::npos, "classification missing");
    require(text.find("(confirmed)") != std::string::npos, "confirmation missing");

    healrun::driver::DriverCallStats exists;
    exists.method = "exists";
    exists.call_count = 4;
    exists.success_count = 3;
    exists.failure_count = 1;
    const std::string with_calls = rep::format_report_text(
        rep::FlakinessAggregator{}.finalize({exists}));
    require(with_calls.find("Driver method") != std::string::npos, "driver call table missing");
    require(with_calls.find("75.0%") != std::string::npos, "success rate missing");
  }});

  tests.push_back({"report_write_file", [] {
    TempDir dir("healrun-report-");
    rep::FlakinessAggregator aggregator;
    aggregator.ingest(verdict("a", {action(exec::ActionStatus::Success)}));
    const auto report = aggregator.finalize();
    const auto path = dir.path() / "nested" / "report.json";
    const auto status = rep::write_report_file(report, path);
    require(status.ok(), status.ok() ? "" : status.error());

    std::ifstream in(path);
    std::stringstream buffer;
    buffer << in.rdbuf();
    require(healrun::common::json_has_key(buffer.str(), "digest"), "digest missing from file");
  }});
}
