#pragma once

#include "healrun/common/result.hpp"

#include <string>

namespace healrun::common {

/// Lower-case hex SHA-256 of `data`.
[[nodiscard]] Result<std::string> sha256_hex(const std::string &data);

} // namespace healrun::common
