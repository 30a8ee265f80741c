#include "healrun/execution/types.hpp"

#include "healrun/common/fs.hpp"

namespace healrun::execution {

std::string_view action_kind_name(const ActionKind kind) {
  switch (kind) {
  case ActionKind::Navigate:
    return "navigate";
  case ActionKind::Fill:
    return "fill";
  case ActionKind::Click:
    return "click";
  case ActionKind::Assert:
    return "assert";
  }
  return "click";
}

std::optional<ActionKind> parse_action_kind(const std::string &name) {
  const std::string lowered = common::to_lower(common::trim(name));
  if (lowered == "navigate" || lowered == "goto") {
    return ActionKind::Navigate;
  }
  if (lowered == "fill") {
    return ActionKind::Fill;
  }
  if (lowered == "click") {
    return ActionKind::Click;
  }
  if (lowered == "assert") {
    return ActionKind::Assert;
  }
  return std::nullopt;
}

std::string_view action_status_name(const ActionStatus status) {
  switch (status) {
  case ActionStatus::Success:
    return "success";
  case ActionStatus::RetriedSuccess:
    return "retried-success";
  case ActionStatus::Failed:
    return "failed";
  }
  return "failed";
}

std::string_view failure_kind_name(const FailureKind kind) {
  switch (kind) {
  case FailureKind::None:
    return "none";
  case FailureKind::ResolutionTimeout:
    return "resolution-timeout";
  case FailureKind::ActionError:
    return "action-error";
  case FailureKind::DeadlineExceeded:
    return "deadline-exceeded";
  case FailureKind::EvidenceCaptureFailed:
    return "evidence-capture-failed";
  }
  return "none";
}

std::string_view verdict_status_name(const VerdictStatus status) {
  switch (status) {
  case VerdictStatus::Pass:
    return "pass";
  case VerdictStatus::Fail:
    return "fail";
  case VerdictStatus::Flaky:
    return "flaky";
  }
  return "fail";
}

VerdictStatus derive_verdict_status(const std::vector<ActionResult> &actions) {
  bool retried = false;
  for (const auto &action : actions) {
    if (action.status == ActionStatus::Failed) {
      return VerdictStatus::Fail;
    }
    if (action.status == ActionStatus::RetriedSuccess) {
      retried = true;
    }
  }
  return retried ? VerdictStatus::Flaky : VerdictStatus::Pass;
}

} // namespace healrun::execution
