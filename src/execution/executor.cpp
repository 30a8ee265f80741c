#include "healrun/execution/executor.hpp"

#include "healrun/common/fs.hpp"
#include "healrun/config/config.hpp"
#include "healrun/observability/global.hpp"

#include <algorithm>

namespace healrun::execution {

namespace {

std::string describe(const TestStep &step) {
  std::string out(action_kind_name(step.kind));
  if (!step.target.empty()) {
    out += " " + step.target;
  }
  return out;
}

} // namespace

std::chrono::milliseconds RetryPolicy::backoff_for(const std::uint32_t retry) const {
  if (backoff_base.count() <= 0) {
    return std::chrono::milliseconds(0);
  }
  // Past 2^30 every realistic cap has been reached already.
  const std::uint32_t shift = std::min<std::uint32_t>(retry, 30);
  const auto factor = static_cast<std::int64_t>(1) << shift;
  const std::int64_t cap = backoff_cap.count();
  if (backoff_base.count() > cap / factor) {
    return backoff_cap;
  }
  return std::min(backoff_cap, std::chrono::milliseconds(backoff_base.count() * factor));
}

RetryPolicy RetryPolicy::from_config(const config::RetryConfig &config) {
  return RetryPolicy{
      .max_retries = config.max_retries,
      .backoff_base = std::chrono::milliseconds(config.backoff_base_ms),
      .backoff_cap = std::chrono::milliseconds(config.backoff_cap_ms),
  };
}

ActionExecutor::ActionExecutor(driver::IDriver &driver, selectors::SelfHealingResolver &resolver,
                               RetryPolicy policy, const std::chrono::milliseconds settle)
    : driver_(driver), resolver_(resolver), policy_(policy), settle_(settle) {}

common::Status ActionExecutor::perform(const TestStep &step, const std::string &locator) {
  switch (step.kind) {
  case ActionKind::Navigate:
    return driver_.navigate(common::expand_env_placeholders(step.value));
  case ActionKind::Fill:
    return driver_.fill(locator, common::expand_env_placeholders(step.value));
  case ActionKind::Click:
    return driver_.click(locator);
  case ActionKind::Assert:
    // Resolution already proved presence.
    return common::Status::success();
  }
  return common::Status::error("unsupported action");
}

ActionResult ActionExecutor::execute(const TestStep &step, common::CancellationToken &token) {
  const auto started = std::chrono::steady_clock::now();
  ActionResult result;
  result.kind = step.kind;
  result.target = step.target;

  const bool needs_target = step.kind != ActionKind::Navigate;
  bool succeeded = false;

  for (std::uint32_t attempt = 0; attempt <= policy_.max_retries; ++attempt) {
    if (attempt > 0) {
      const auto delay = policy_.backoff_for(attempt - 1);
      observability::record_info("executor", describe(step) + ": retry " +
                                                 std::to_string(attempt) + " in " +
                                                 std::to_string(delay.count()) + "ms");
      if (!token.wait_for(delay)) {
        result.failure = FailureKind::DeadlineExceeded;
        result.error = "deadline exceeded while waiting to retry";
        break;
      }
    }
    if (token.cancelled()) {
      result.failure = FailureKind::DeadlineExceeded;
      result.error = "deadline exceeded";
      break;
    }
    result.retry_count = attempt;

    std::string locator;
    if (needs_target) {
      auto outcome = resolver_.resolve(step.target, &token);
      const bool resolved = outcome.status != selectors::ResolutionStatus::Unresolved;
      if (resolved) {
        locator = outcome.locator;
      }
      result.resolution = std::move(outcome);
      if (!resolved) {
        if (token.cancelled()) {
          result.failure = FailureKind::DeadlineExceeded;
          result.error = "deadline exceeded while resolving " + step.target;
          break;
        }
        result.failure = FailureKind::ResolutionTimeout;
        result.error = "no candidate for " + step.target + " matched the live page";
        continue;
      }
    }

    auto status = perform(step, locator);
    if (!status.ok()) {
      if (token.cancelled()) {
        result.failure = FailureKind::DeadlineExceeded;
        result.error = "deadline exceeded during " + describe(step) + ": " + status.error();
        break;
      }
      result.failure = FailureKind::ActionError;
      result.error = status.error();
      continue;
    }

    succeeded = true;
    result.failure = FailureKind::None;
    result.error.clear();
    break;
  }

  if (succeeded) {
    result.status = result.retry_count > 0 ? ActionStatus::RetriedSuccess : ActionStatus::Success;
    if (settle_.count() > 0 && !token.wait_for(settle_)) {
      // The next action observes the fired token; this one already succeeded.
      observability::record_info("executor", describe(step) + ": settle interrupted");
    }
  } else {
    result.status = ActionStatus::Failed;
    observability::record_error("executor", describe(step) + " failed (" +
                                                std::string(failure_kind_name(result.failure)) +
                                                "): " + result.error);
    attach_evidence(result);
  }

  observability::record_metric("executor.retries", static_cast<double>(result.retry_count));
  result.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  return result;
}

void ActionExecutor::attach_evidence(ActionResult &result) {
  auto evidence = driver_.capture_evidence();
  if (evidence.ok()) {
    result.evidence_ref = evidence.value();
    return;
  }
  result.evidence_capture_failed = true;
  observability::record_warning("executor", std::string(failure_kind_name(
                                                FailureKind::EvidenceCaptureFailed)) +
                                                ": " + evidence.error());
}

} // namespace healrun::execution
