#pragma once

#include <cstdint>

namespace healrun::common {

/// Wall-clock milliseconds since the Unix epoch.
[[nodiscard]] std::int64_t unix_time_ms();

} // namespace healrun::common
