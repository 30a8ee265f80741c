#pragma once

#include "healrun/driver/driver.hpp"

#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace healrun::driver {

struct DriverCallStats {
  std::string method;
  std::uint64_t call_count = 0;
  std::uint64_t success_count = 0;
  std::uint64_t failure_count = 0;
  double avg_latency_ms = 0.0;
  double total_latency_ms = 0.0;
  double success_rate() const {
    return call_count > 0 ? (static_cast<double>(success_count) / static_cast<double>(call_count)) : 0.0;
  }
};

/// Per-capability call statistics, shared by every driver in a suite run.
class DriverProfiler {
public:
  void record(const std::string &method, bool success, std::chrono::milliseconds latency);

  // Sorted by method name
  [[nodiscard]] std::vector<DriverCallStats> all_stats() const;

  void reset();

private:
  std::unordered_map<std::string, DriverCallStats> stats_;
  mutable std::mutex mutex_;
};

/// Forwards every call to `inner` and records it in `profiler`. For
/// exists() a miss counts as an unsuccessful call.
class ProfilingDriver final : public IDriver {
public:
  ProfilingDriver(IDriver &inner, DriverProfiler &profiler);

  [[nodiscard]] bool exists(const std::string &locator,
                            std::chrono::milliseconds timeout) override;
  [[nodiscard]] common::Status fill(const std::string &locator, const std::string &value) override;
  [[nodiscard]] common::Status click(const std::string &locator) override;
  [[nodiscard]] common::Status navigate(const std::string &url) override;
  [[nodiscard]] common::Result<std::string> capture_evidence() override;

private:
  IDriver &inner_;
  DriverProfiler &profiler_;
};

} // namespace healrun::driver
