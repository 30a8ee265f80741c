#pragma once

#include "healrun/common/result.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace healrun::config {

struct RetryConfig {
  std::uint32_t max_retries = 3;
  std::uint64_t backoff_base_ms = 250;
  std::uint64_t backoff_cap_ms = 4000;
};

struct ResolverConfig {
  std::uint64_t existence_probe_timeout_ms = 300;
};

struct RankerConfig {
  std::uint64_t freshness_window_ms = 600'000;
  double recency_bonus = 0.6;
};

struct ExecutionConfig {
  std::uint32_t max_concurrent_test_cases = 4;
  std::uint64_t per_test_case_deadline_ms = 120'000;
  std::uint64_t post_action_settle_ms = 0;
  bool isolate_candidate_stores = true;
};

struct ReplayConfig {
  std::uint32_t runs = 1;
  bool rerun_failed = true;
};

struct ObservabilityConfig {
  std::string backend = "log";
};

struct FallbackPoolConfig {
  std::string id;
  std::vector<std::string> candidates;
  double confidence = 0.1;
};

struct Config {
  RetryConfig retry;
  ResolverConfig resolver;
  RankerConfig ranker;
  ExecutionConfig execution;
  ReplayConfig replay;
  ObservabilityConfig observability;
  /// Pools declared in config; merged over the built-in pools by id.
  std::vector<FallbackPoolConfig> fallbacks;
};

[[nodiscard]] common::Result<std::filesystem::path> config_dir();
[[nodiscard]] common::Result<std::filesystem::path> config_path();
[[nodiscard]] bool config_exists();

void set_config_path_override(std::optional<std::filesystem::path> path);
void clear_config_path_override();
[[nodiscard]] std::optional<std::filesystem::path> config_path_override();

[[nodiscard]] common::Status apply_env_overrides(Config &config);

/// Load config.toml (or defaults when absent) and apply HEALRUN_* overrides.
[[nodiscard]] common::Result<Config> load_config();

/// Parse config text directly; no file or environment lookup.
[[nodiscard]] common::Result<Config> parse_config(const std::string &toml_text);

/// Returns warnings on success, or the first hard error.
[[nodiscard]] common::Result<std::vector<std::string>> validate_config(const Config &config);

} // namespace healrun::config
