#pragma once

#include <string>

namespace healrun::config {

[[nodiscard]] std::string json_schema();

} // namespace healrun::config
