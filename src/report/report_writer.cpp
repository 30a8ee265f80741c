#include "healrun/report/report_writer.hpp"

#include "healrun/common/digest.hpp"
#include "healrun/common/fs.hpp"
#include "healrun/common/json_util.hpp"

#include <fstream>
#include <iomanip>
#include <sstream>

namespace healrun::report {

namespace {

std::string json_quoted(const std::string &value) {
  return "\"" + common::json_escape(value) + "\"";
}

std::string fixed(const double value) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << value;
  return out.str();
}

void render_test_case(std::ostringstream &out, const TestCaseSummary &summary) {
  out << "{\"id\":" << json_quoted(summary.test_case_id)
      << ",\"classification\":"
      << json_quoted(std::string(classification_name(summary.classification)))
      << ",\"confirmed\":" << (summary.flakiness_confirmed ? "true" : "false")
      << ",\"runs\":" << summary.runs << ",\"pass\":" << summary.pass_count
      << ",\"fail\":" << summary.fail_count << ",\"flaky\":" << summary.flaky_count;
  if (summary.last_failure != execution::FailureKind::None) {
    out << ",\"last_failure\":"
        << json_quoted(std::string(execution::failure_kind_name(summary.last_failure)))
        << ",\"last_error\":" << json_quoted(summary.last_error);
  }
  out << ",\"failure_kinds\":[";
  bool first = true;
  for (const auto kind : summary.failure_kinds) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << json_quoted(std::string(execution::failure_kind_name(kind)));
  }
  out << "]";
  out << ",\"evidence\":[";
  for (std::size_t i = 0; i < summary.evidence_refs.size(); ++i) {
    if (i > 0) {
      out << ",";
    }
    out << json_quoted(summary.evidence_refs[i]);
  }
  out << "],\"evidence_capture_failures\":" << summary.evidence_capture_failures << "}";
}

} // namespace

std::string render_report_body(const SessionReport &report) {
  std::ostringstream out;
  const auto &totals = report.totals;
  out << "{\"generated_at_ms\":" << report.generated_at_ms;
  out << ",\"totals\":{\"test_cases\":" << totals.test_cases << ",\"runs\":" << totals.runs
      << ",\"passed\":" << totals.passed << ",\"failed\":" << totals.failed
      << ",\"flaky_runs\":" << totals.flaky_runs
      << ",\"flaky_test_cases\":" << totals.flaky_test_cases
      << ",\"malformed_verdicts\":" << totals.malformed_verdicts << "}";

  out << ",\"test_cases\":[";
  bool first = true;
  for (const auto &[id, summary] : report.test_cases) {
    if (!first) {
      out << ",";
    }
    first = false;
    render_test_case(out, summary);
  }
  out << "]";

  out << ",\"healing\":[";
  first = true;
  for (const auto &[id, stats] : report.healing) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << "{\"descriptor\":" << json_quoted(id) << ",\"resolved\":" << stats.resolved
        << ",\"resolved_with_fallback\":" << stats.resolved_with_fallback
        << ",\"unresolved\":" << stats.unresolved
        << ",\"last_winning_locator\":" << json_quoted(stats.last_winning_locator) << "}";
  }
  out << "]";

  out << ",\"driver_calls\":[";
  for (std::size_t i = 0; i < report.driver_calls.size(); ++i) {
    const auto &call = report.driver_calls[i];
    if (i > 0) {
      out << ",";
    }
    out << "{\"method\":" << json_quoted(call.method) << ",\"calls\":" << call.call_count
        << ",\"failures\":" << call.failure_count
        << ",\"avg_latency_ms\":" << fixed(call.avg_latency_ms) << "}";
  }
  out << "]}";
  return out.str();
}

common::Result<std::string> render_report_json(const SessionReport &report) {
  const std::string body = render_report_body(report);
  auto digest = common::sha256_hex(body);
  if (!digest.ok()) {
    return common::Result<std::string>::failure("report digest failed: " + digest.error());
  }
  return common::Result<std::string>::success("{\"digest\":" + json_quoted(digest.value()) +
                                              ",\"report\":" + body + "}");
}

std::string format_report_text(const SessionReport &report) {
  std::ostringstream out;
  const auto &totals = report.totals;
  out << "Session Report\n";
  out << std::string(60, '-') << "\n";
  out << totals.test_cases << " test case(s), " << totals.runs << " run(s): " << totals.passed
      << " passed, " << totals.failed << " failed, " << totals.flaky_runs << " flaky\n";
  if (totals.malformed_verdicts > 0) {
    out << totals.malformed_verdicts << " malformed verdict(s) normalized\n";
  }
  out << std::string(60, '-') << "\n";

  for (const auto &[id, summary] : report.test_cases) {
    out << std::left << std::setw(30) << id << std::setw(7)
        << classification_name(summary.classification) << " " << summary.pass_count << "/"
        << summary.fail_count << "/" << summary.flaky_count;
    if (summary.flakiness_confirmed) {
      out << " (confirmed)";
    }
    if (summary.last_failure != execution::FailureKind::None) {
      out << "  " << execution::failure_kind_name(summary.last_failure) << ": "
          << summary.last_error;
    }
    out << "\n";
    if (summary.failure_kinds.size() > 1) {
      out << "    failure kinds:";
      for (const auto kind : summary.failure_kinds) {
        out << " " << execution::failure_kind_name(kind);
      }
      out << "\n";
    }
  }

  std::uint32_t healed = 0;
  for (const auto &[id, stats] : report.healing) {
    healed += stats.resolved_with_fallback;
  }
  if (healed > 0) {
    out << healed << " resolution(s) healed via fallback\n";
  }

  if (!report.driver_calls.empty()) {
    out << std::string(60, '-') << "\n";
    out << std::left << std::setw(30) << "Driver method" << std::right << std::setw(6) << "Calls"
        << std::setw(8) << "OK%" << std::setw(12) << "Avg ms" << "\n";
    for (const auto &call : report.driver_calls) {
      out << std::left << std::setw(30) << call.method << std::right << std::setw(6)
          << call.call_count << std::setw(7) << std::fixed << std::setprecision(1)
          << (call.success_rate() * 100.0) << "%" << std::setw(12) << call.avg_latency_ms << "\n";
    }
  }
  return out.str();
}

common::Status write_report_file(const SessionReport &report, const std::filesystem::path &path) {
  auto json = render_report_json(report);
  if (!json.ok()) {
    return common::Status::error(json.error());
  }
  if (path.has_parent_path()) {
    auto dir = common::ensure_dir(path.parent_path());
    if (!dir.ok()) {
      return common::Status::error(dir.error());
    }
  }
  std::ofstream out(path, std::ios::trunc);
  if (!out) {
    return common::Status::error("failed to open report file: " + path.string());
  }
  out << json.value() << "\n";
  if (!out) {
    return common::Status::error("failed to write report file: " + path.string());
  }
  return common::Status::success();
}

} // namespace healrun::report
