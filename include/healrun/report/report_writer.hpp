#pragma once

#include "healrun/common/result.hpp"
#include "healrun/report/aggregator.hpp"

#include <filesystem>
#include <string>

namespace healrun::report {

/// The report body as a JSON object, without the digest envelope.
[[nodiscard]] std::string render_report_body(const SessionReport &report);

/// {"digest": "<sha256 of report>", "report": {...}}
[[nodiscard]] common::Result<std::string> render_report_json(const SessionReport &report);

/// Human-readable summary, one line per test case.
[[nodiscard]] std::string format_report_text(const SessionReport &report);

[[nodiscard]] common::Status write_report_file(const SessionReport &report,
                                               const std::filesystem::path &path);

} // namespace healrun::report
