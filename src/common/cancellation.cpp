#include "healrun/common/cancellation.hpp"

#include <algorithm>

namespace healrun::common {

namespace {

using SteadyClock = std::chrono::steady_clock;

// nullopt when `budget` would run past the end of the clock.
std::optional<SteadyClock::time_point> time_after(const SteadyClock::time_point now,
                                                  const std::chrono::milliseconds budget) {
  const auto headroom =
      std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::time_point::max() - now);
  if (budget >= headroom) {
    return std::nullopt;
  }
  return now + budget;
}

} // namespace

CancellationToken::CancellationToken(const std::chrono::milliseconds budget)
    : deadline_(time_after(SteadyClock::now(), budget)) {}

void CancellationToken::cancel() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    cancel_requested_ = true;
  }
  cv_.notify_all();
}

bool CancellationToken::cancelled() const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (cancel_requested_) {
    return true;
  }
  return deadline_.has_value() && SteadyClock::now() >= *deadline_;
}

std::chrono::milliseconds CancellationToken::remaining() const {
  if (!deadline_.has_value()) {
    return std::chrono::milliseconds::max();
  }
  const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
      *deadline_ - SteadyClock::now());
  return std::max(left, std::chrono::milliseconds(0));
}

bool CancellationToken::wait_for(const std::chrono::milliseconds duration) {
  const auto wake_at = time_after(SteadyClock::now(), duration);
  const bool deadline_first =
      deadline_.has_value() && (!wake_at.has_value() || *deadline_ <= *wake_at);
  const auto requested = [this] { return cancel_requested_; };

  std::unique_lock<std::mutex> lock(mutex_);
  if (!deadline_first && !wake_at.has_value()) {
    cv_.wait(lock, requested);
    return false;
  }
  const bool woken = cv_.wait_until(lock, deadline_first ? *deadline_ : *wake_at, requested);
  if (woken) {
    return false;
  }
  return !deadline_first;
}

} // namespace healrun::common
