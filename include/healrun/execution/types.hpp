#pragma once

#include "healrun/selectors/types.hpp"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace healrun::execution {

enum class ActionKind { Navigate, Fill, Click, Assert };

enum class ActionStatus { Success, RetriedSuccess, Failed };

enum class FailureKind { None, ResolutionTimeout, ActionError, DeadlineExceeded, EvidenceCaptureFailed };

enum class VerdictStatus { Pass, Fail, Flaky };

[[nodiscard]] std::string_view action_kind_name(ActionKind kind);
[[nodiscard]] std::optional<ActionKind> parse_action_kind(const std::string &name);
[[nodiscard]] std::string_view action_status_name(ActionStatus status);
[[nodiscard]] std::string_view failure_kind_name(FailureKind kind);
[[nodiscard]] std::string_view verdict_status_name(VerdictStatus status);

/// One user-intent action. `target` names an element descriptor (unused for
/// navigate); `value` is the fill text or the navigation URL and may contain
/// ${NAME} environment placeholders.
struct TestStep {
  ActionKind kind = ActionKind::Click;
  std::string target;
  std::string value;
};

struct TestCase {
  std::string id;
  std::vector<TestStep> steps;
};

struct ActionResult {
  ActionKind kind = ActionKind::Click;
  std::string target;
  ActionStatus status = ActionStatus::Failed;
  std::uint32_t retry_count = 0;
  FailureKind failure = FailureKind::None;
  std::string error;
  std::optional<std::string> evidence_ref;
  bool evidence_capture_failed = false;
  /// Last resolution attempted for this action, if the action has a target.
  std::optional<selectors::ResolutionOutcome> resolution;
  std::chrono::milliseconds elapsed{0};
};

struct TestVerdict {
  std::string test_case_id;
  std::uint32_t run_index = 0;
  std::vector<ActionResult> actions;
  VerdictStatus status = VerdictStatus::Pass;
  std::chrono::milliseconds duration{0};
  /// Set when the test case could not be started at all.
  std::string error;
};

/// fail if any action failed, else flaky if any needed a retry, else pass.
[[nodiscard]] VerdictStatus derive_verdict_status(const std::vector<ActionResult> &actions);

} // namespace healrun::execution
