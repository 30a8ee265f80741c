#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <optional>

namespace healrun::common {

/// Cancellation flag with an optional deadline. Waits performed through the
/// token wake early when it is cancelled or the deadline passes.
class CancellationToken {
public:
  CancellationToken() = default;
  /// A budget too large for the clock leaves the token without a deadline.
  explicit CancellationToken(std::chrono::milliseconds budget);

  CancellationToken(const CancellationToken &) = delete;
  CancellationToken &operator=(const CancellationToken &) = delete;

  void cancel();

  /// True once cancel() was called or the deadline has passed.
  [[nodiscard]] bool cancelled() const;
  [[nodiscard]] bool has_deadline() const { return deadline_.has_value(); }

  /// Time left before the deadline; milliseconds::max() without one.
  [[nodiscard]] std::chrono::milliseconds remaining() const;

  /// Sleep for `duration`. Returns false if the token fired first.
  [[nodiscard]] bool wait_for(std::chrono::milliseconds duration);

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  bool cancel_requested_ = false;
  std::optional<std::chrono::steady_clock::time_point> deadline_;
};

} // namespace healrun::common
