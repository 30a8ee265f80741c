#include "healrun/observability/factory.hpp"

#include "healrun/common/fs.hpp"

namespace healrun::observability {

std::shared_ptr<IObserver> create_observer(const config::Config &config) {
  const std::string backend = common::to_lower(common::trim(config.observability.backend));
  if (backend == "none") {
    return std::make_shared<NoopObserver>();
  }
  return std::make_shared<LogObserver>();
}

} // namespace healrun::observability
