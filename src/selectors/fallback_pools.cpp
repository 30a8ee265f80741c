#include "healrun/selectors/fallback_pools.hpp"

#include <algorithm>

namespace healrun::selectors {

std::vector<FallbackPool> builtin_fallback_pools() {
  return {
      {.id = "username",
       .locators = {R"(input[name="username"])", R"(input[name*="user"])",
                    R"(input[name*="login"])", R"(input[type="email"])", "#username",
                    ".username", R"(input[placeholder*="user"])",
                    R"(input[placeholder*="email"])",
                    R"(input[type="text"]:not([name*="search"]))"},
       .confidence = 0.1},
      {.id = "password",
       .locators = {R"(input[name="password"])", R"(input[type="password"])",
                    R"(input[name*="pass"])", "#password", ".password",
                    R"(input[placeholder*="pass"])"},
       .confidence = 0.1},
      {.id = "login_button",
       .locators = {R"(button[type="submit"])", R"(input[type="submit"])",
                    R"(button:has-text("Login"))", R"(button:has-text("Log in"))",
                    R"(button:has-text("Sign in"))", R"(input[value*="Login"])",
                    R"(button[class*="login"])", R"(button[id*="login"])",
                    R"([type="submit"])"},
       .confidence = 0.1},
  };
}

std::vector<FallbackPool>
merge_fallback_pools(const std::vector<config::FallbackPoolConfig> &configured) {
  auto pools = builtin_fallback_pools();
  for (const auto &entry : configured) {
    FallbackPool pool{.id = entry.id, .locators = entry.candidates, .confidence = entry.confidence};
    auto it = std::find_if(pools.begin(), pools.end(),
                           [&](const FallbackPool &existing) { return existing.id == entry.id; });
    if (it != pools.end()) {
      *it = std::move(pool);
    } else {
      pools.push_back(std::move(pool));
    }
  }
  return pools;
}

} // namespace healrun::selectors
