#include "healrun/driver/profiler.hpp"

#include <algorithm>

namespace healrun::driver {

namespace {

using SteadyClock = std::chrono::steady_clock;

std::chrono::milliseconds since(const SteadyClock::time_point start) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(SteadyClock::now() - start);
}

} // namespace

void DriverProfiler::record(const std::string &method, const bool success,
                            const std::chrono::milliseconds latency) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto &s = stats_[method];
  s.method = method;
  s.call_count++;
  if (success) {
    s.success_count++;
  } else {
    s.failure_count++;
  }
  const double lat = static_cast<double>(latency.count());
  s.total_latency_ms += lat;
  s.avg_latency_ms = s.total_latency_ms / static_cast<double>(s.call_count);
}

std::vector<DriverCallStats> DriverProfiler::all_stats() const {
  std::vector<DriverCallStats> out;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    out.reserve(stats_.size());
    for (const auto &[name, stat] : stats_) {
      out.push_back(stat);
    }
  }
  std::sort(out.begin(), out.end(), [](const DriverCallStats &a, const DriverCallStats &b) {
    return a.method < b.method;
  });
  return out;
}

void DriverProfiler::reset() {
  std::lock_guard<std::mutex> lock(mutex_);
  stats_.clear();
}

// ---------------------------------------------------------------------------
// ProfilingDriver
// ---------------------------------------------------------------------------

ProfilingDriver::ProfilingDriver(IDriver &inner, DriverProfiler &profiler)
    : inner_(inner), profiler_(profiler) {}

bool ProfilingDriver::exists(const std::string &locator, const std::chrono::milliseconds timeout) {
  const auto start = SteadyClock::now();
  const bool found = inner_.exists(locator, timeout);
  profiler_.record("exists", found, since(start));
  return found;
}

common::Status ProfilingDriver::fill(const std::string &locator, const std::string &value) {
  const auto start = SteadyClock::now();
  auto status = inner_.fill(locator, value);
  profiler_.record("fill", status.ok(), since(start));
  return status;
}

common::Status ProfilingDriver::click(const std::string &locator) {
  const auto start = SteadyClock::now();
  auto status = inner_.click(locator);
  profiler_.record("click", status.ok(), since(start));
  return status;
}

common::Status ProfilingDriver::navigate(const std::string &url) {
  const auto start = SteadyClock::now();
  auto status = inner_.navigate(url);
  profiler_.record("navigate", status.ok(), since(start));
  return status;
}

common::Result<std::string> ProfilingDriver::capture_evidence() {
  const auto start = SteadyClock::now();
  auto evidence = inner_.capture_evidence();
  profiler_.record("capture_evidence", evidence.ok(), since(start));
  return evidence;
}

} // namespace healrun::driver
