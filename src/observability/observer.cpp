#include "healrun/observability/observer.hpp"

#include <iostream>
#include <mutex>

namespace healrun::observability {

namespace {

std::mutex g_stderr_mutex;

} // namespace

std::string_view event_level_name(const EventLevel level) {
  switch (level) {
  case EventLevel::Info:
    return "info";
  case EventLevel::Warning:
    return "warning";
  case EventLevel::Error:
    return "error";
  }
  return "info";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(g_stderr_mutex);
  std::cerr << "[" << event.component << "] ";
  if (event.level != EventLevel::Info) {
    std::cerr << event_level_name(event.level) << ": ";
  }
  std::cerr << event.message << "\n";
}

void LogObserver::record_metric(const std::string &metric, const double value) {
  std::lock_guard<std::mutex> lock(g_stderr_mutex);
  std::cerr << "[metric] " << metric << "=" << value << "\n";
}

} // namespace healrun::observability
