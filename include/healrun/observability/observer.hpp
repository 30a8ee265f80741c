#pragma once

#include <string>
#include <string_view>

namespace healrun::observability {

enum class EventLevel { Info, Warning, Error };

[[nodiscard]] std::string_view event_level_name(EventLevel level);

struct ObserverEvent {
  EventLevel level = EventLevel::Info;
  std::string component;
  std::string message;
};

class IObserver {
public:
  virtual ~IObserver() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const std::string &metric, double value) = 0;
};

/// Writes one `[component] message` line per event to stderr.
class LogObserver final : public IObserver {
public:
  [[nodiscard]] std::string_view name() const override { return "log"; }
  void record_event(const ObserverEvent &event) override;
  void record_metric(const std::string &metric, double value) override;
};

class NoopObserver final : public IObserver {
public:
  [[nodiscard]] std::string_view name() const override { return "none"; }
  void record_event(const ObserverEvent &) override {}
  void record_metric(const std::string &, double) override {}
};

} // namespace healrun::observability
