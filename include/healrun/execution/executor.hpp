#pragma once

#include "healrun/common/cancellation.hpp"
#include "healrun/driver/driver.hpp"
#include "healrun/execution/types.hpp"
#include "healrun/selectors/resolver.hpp"

#include <chrono>
#include <cstdint>

namespace healrun::config {
struct RetryConfig;
}

namespace healrun::execution {

struct RetryPolicy {
  std::uint32_t max_retries = 3;
  std::chrono::milliseconds backoff_base{250};
  std::chrono::milliseconds backoff_cap{4000};

  /// base * 2^retry, capped.
  [[nodiscard]] std::chrono::milliseconds backoff_for(std::uint32_t retry) const;

  [[nodiscard]] static RetryPolicy from_config(const config::RetryConfig &config);
};

/// Runs one action against the live page. An unresolved target and a failed
/// driver operation are both retried with exponential backoff until the
/// retry budget is spent or `token` fires.
class ActionExecutor {
public:
  ActionExecutor(driver::IDriver &driver, selectors::SelfHealingResolver &resolver,
                 RetryPolicy policy,
                 std::chrono::milliseconds settle = std::chrono::milliseconds(0));

  [[nodiscard]] ActionResult execute(const TestStep &step, common::CancellationToken &token);

  [[nodiscard]] const RetryPolicy &policy() const { return policy_; }

private:
  common::Status perform(const TestStep &step, const std::string &locator);
  void attach_evidence(ActionResult &result);

  driver::IDriver &driver_;
  selectors::SelfHealingResolver &resolver_;
  RetryPolicy policy_;
  std::chrono::milliseconds settle_;
};

} // namespace healrun::execution
