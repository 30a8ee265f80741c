#pragma once

#include "healrun/config/config.hpp"

#include <string>
#include <vector>

namespace healrun::selectors {

struct FallbackPool {
  std::string id;
  std::vector<std::string> locators;
  double confidence = 0.1;
};

/// Generic login-form locators: "username", "password" and "login_button".
[[nodiscard]] std::vector<FallbackPool> builtin_fallback_pools();

/// Built-in pools with configured pools layered on top; a configured pool
/// replaces a built-in one of the same id.
[[nodiscard]] std::vector<FallbackPool>
merge_fallback_pools(const std::vector<config::FallbackPoolConfig> &configured);

} // namespace healrun::selectors
