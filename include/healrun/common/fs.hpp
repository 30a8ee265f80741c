#pragma once

#include "healrun/common/result.hpp"

#include <filesystem>
#include <string>

namespace healrun::common {

[[nodiscard]] std::string trim(const std::string &value);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] bool ends_with(const std::string &value, const std::string &suffix);

/// Expand a leading `~` and `$NAME` / `${NAME}` environment references.
[[nodiscard]] std::string expand_path(const std::string &path);

/// Expand only `${NAME}` references; unset variables expand to "".
[[nodiscard]] std::string expand_env_placeholders(const std::string &value);

[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);

} // namespace healrun::common
