#pragma once

#include "healrun/observability/observer.hpp"

#include <memory>
#include <string>

namespace healrun::observability {

/// Install the process-wide observer. Passing nullptr restores the default
/// stderr logger.
void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> global_observer();

void record_info(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);
void record_metric(const std::string &metric, double value);

} // namespace healrun::observability
