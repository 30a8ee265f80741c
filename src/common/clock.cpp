#include "healrun/common/clock.hpp"

#include <chrono>

namespace healrun::common {

std::int64_t unix_time_ms() {
  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

} // namespace healrun::common
