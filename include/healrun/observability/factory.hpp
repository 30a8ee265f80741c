#pragma once

#include "healrun/config/config.hpp"
#include "healrun/observability/observer.hpp"

#include <memory>

namespace healrun::observability {

[[nodiscard]] std::shared_ptr<IObserver> create_observer(const config::Config &config);

} // namespace healrun::observability
