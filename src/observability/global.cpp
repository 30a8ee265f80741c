#include "healrun/observability/global.hpp"

#include <mutex>

namespace healrun::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

void emit(const EventLevel level, const std::string &component, const std::string &message) {
  global_observer()->record_event({.level = level, .component = component, .message = message});
}

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  if (g_observer == nullptr) {
    g_observer = std::make_shared<LogObserver>();
  }
  return g_observer;
}

void record_info(const std::string &component, const std::string &message) {
  emit(EventLevel::Info, component, message);
}

void record_warning(const std::string &component, const std::string &message) {
  emit(EventLevel::Warning, component, message);
}

void record_error(const std::string &component, const std::string &message) {
  emit(EventLevel::Error, component, message);
}

void record_metric(const std::string &metric, const double value) {
  global_observer()->record_metric(metric, value);
}

} // namespace healrun::observability
