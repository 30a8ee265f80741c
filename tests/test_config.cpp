#include "test_framework.hpp"

#include "healrun/config/config.hpp"
#include "healrun/config/schema.hpp"
#include "healrun/observability/factory.hpp"
#include "healrun/selectors/fallback_pools.hpp"

#include <algorithm>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <random>
#include <string>
#include <vector>

namespace {

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value) : key(std::move(key_)) {
    if (const char *existing = std::getenv(key.c_str()); existing != nullptr) {
      old_value = existing;
    }
    if (value.has_value()) {
      setenv(key.c_str(), value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }

  ~EnvGuard() {
    if (old_value.has_value()) {
      setenv(key.c_str(), old_value->c_str(), 1);
    } else {
      unsetenv(key.c_str());
    }
  }
};

struct ConfigOverrideGuard {
  std::optional<std::filesystem::path> old_override;

  explicit ConfigOverrideGuard(std::optional<std::filesystem::path> next = std::nullopt) {
    old_override = healrun::config::config_path_override();
    if (next.has_value()) {
      healrun::config::set_config_path_override(*next);
    } else {
      healrun::config::clear_config_path_override();
    }
  }

  ~ConfigOverrideGuard() {
    if (old_override.has_value()) {
      healrun::config::set_config_path_override(*old_override);
    } else {
      healrun::config::clear_config_path_override();
    }
  }
};

class TempDir {
public:
  explicit TempDir(const std::string &prefix) {
    static std::mt19937_64 rng{std::random_device{}()};
    path_ = std::filesystem::temp_directory_path() / (prefix + std::to_string(rng()));
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }

private:
  std::filesystem::path path_;
};

void write_file(const std::filesystem::path &path, const std::string &content) {
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  std::ofstream out(path, std::ios::trunc);
  out << content;
}

bool has_warning(const std::vector<std::string> &warnings, const std::string &needle) {
  return std::any_of(warnings.begin(), warnings.end(), [&](const std::string &warning) {
    return warning.find(needle) != std::string::npos;
  });
}

} // namespace

void register_config_tests(std::vector<healrun::tests::TestCase> &tests) {
  using healrun::tests::require;

  tests.push_back({"config_defaults", [] {
    const healrun::config::Config config;
    require(config.retry.max_retries == 3, "max_retries default should be 3");
    require(config.retry.backoff_base_ms == 250, "backoff_base default should be 250");
    require(config.retry.backoff_cap_ms >= config.retry.backoff_base_ms, "cap below base");
    require(config.ranker.freshness_window_ms == 600000, "freshness window default");
    require(config.execution.max_concurrent_test_cases == 4, "concurrency default");
    require(config.replay.runs == 1, "replay runs default");
    const auto validated = healrun::config::validate_config(config);
    require(validated.ok(), "defaults should validate");
    require(validated.value().empty(), "defaults should not warn");
  }});

  tests.push_back({"config_parse_all_sections", [] {
    const auto parsed = healrun::config::parse_config(R"(
[retry]
max_retries = 5
backoff_base_ms = 100
backoff_cap_ms = 800

[resolver]
existence_probe_timeout_ms = 150

[ranker]
freshness_window_ms = 60000
recency_bonus = 0.4

[execution]
max_concurrent_test_cases = 2
per_test_case_deadline_ms = 30000
post_action_settle_ms = 20
isolate_candidate_stores = false

[replay]
runs = 3
rerun_failed = false

[observability]
backend = "none"

[fallbacks.search]
candidates = ["input[type=\"search\"]", "#q"]
confidence = 0.2
)");
    require(parsed.ok(), parsed.ok() ? "" : parsed.error());
    const auto &config = parsed.value();
    require(config.retry.max_retries == 5, "max_retries mismatch");
    require(config.retry.backoff_base_ms == 100, "backoff_base mismatch");
    require(config.retry.backoff_cap_ms == 800, "backoff_cap mismatch");
    require(config.resolver.existence_probe_timeout_ms == 150, "probe timeout mismatch");
    require(config.ranker.freshness_window_ms == 60000, "freshness mismatch");
    require(config.ranker.recency_bonus == 0.4, "recency bonus mismatch");
    require(config.execution.max_concurrent_test_cases == 2, "concurrency mismatch");
    require(config.execution.per_test_case_deadline_ms == 30000, "deadline mismatch");
    require(config.execution.post_action_settle_ms == 20, "settle mismatch");
    require(!config.execution.isolate_candidate_stores, "isolation mismatch");
    require(config.replay.runs == 3, "runs mismatch");
    require(!config.replay.rerun_failed, "rerun_failed mismatch");
    require(config.observability.backend == "none", "backend mismatch");
    require(config.fallbacks.size() == 1, "expected one fallback pool");
    require(config.fallbacks[0].id == "search", "pool id mismatch");
    require(config.fallbacks[0].candidates.size() == 2, "pool candidates mismatch");
    require(config.fallbacks[0].confidence == 0.2, "pool confidence mismatch");
  }});

  tests.push_back({"config_parse_error_reported", [] {
    const auto parsed = healrun::config::parse_config("[retry]\nmax_retries = \n");
    require(!parsed.ok(), "malformed config should fail");
    require(!parsed.error().empty(), "error should be described");
  }});

  tests.push_back({"config_validate_rejections", [] {
    {
      healrun::config::Config config;
      config.execution.max_concurrent_test_cases = 0;
      require(!healrun::config::validate_config(config).ok(), "zero concurrency accepted");
    }
    {
      healrun::config::Config config;
      config.retry.backoff_cap_ms = 100;
      config.retry.backoff_base_ms = 200;
      require(!healrun::config::validate_config(config).ok(), "cap below base accepted");
    }
    {
      healrun::config::Config config;
      config.resolver.existence_probe_timeout_ms = 0;
      require(!healrun::config::validate_config(config).ok(), "zero probe timeout accepted");
    }
    {
      healrun::config::Config config;
      config.retry.max_retries = 50;
      require(!healrun::config::validate_config(config).ok(), "huge retry budget accepted");
    }
    {
      healrun::config::Config config;
      config.ranker.recency_bonus = 1.5;
      require(!healrun::config::validate_config(config).ok(), "recency bonus > 1 accepted");
    }
    {
      healrun::config::Config config;
      config.replay.runs = 0;
      require(!healrun::config::validate_config(config).ok(), "zero runs accepted");
    }
    {
      healrun::config::Config config;
      config.observability.backend = "prometheus";
      const auto validated = healrun::config::validate_config(config);
      require(!validated.ok(), "unknown backend accepted");
      require(validated.error().find("prometheus") != std::string::npos, "error should name backend");
    }
  }});

  tests.push_back({"config_validate_warnings", [] {
    healrun::config::Config config;
    config.execution.per_test_case_deadline_ms = 100;
    config.fallbacks.push_back({.id = "empty", .candidates = {}, .confidence = 0.1});
    const auto validated = healrun::config::validate_config(config);
    require(validated.ok(), "warnings must not fail validation");
    require(has_warning(validated.value(), "per_test_case_deadline_ms"), "missing deadline warning");
    require(has_warning(validated.value(), "fallbacks.empty"), "missing empty pool warning");

    healrun::config::Config unbounded;
    unbounded.execution.per_test_case_deadline_ms = 0;
    require(healrun::config::validate_config(unbounded).value().empty(),
            "an unbounded deadline should not warn");
  }});

  tests.push_back({"config_env_overrides", [] {
    EnvGuard retries("HEALRUN_MAX_RETRIES", std::string("7"));
    EnvGuard width("HEALRUN_MAX_CONCURRENCY", std::string("9"));
    EnvGuard deadline("HEALRUN_DEADLINE_MS", std::string("abc"));
    EnvGuard backend("HEALRUN_OBSERVABILITY", std::string(" NONE "));
    healrun::config::Config config;
    require(healrun::config::apply_env_overrides(config).ok(), "overrides should apply");
    require(config.retry.max_retries == 7, "retry override ignored");
    require(config.execution.max_concurrent_test_cases == 9, "concurrency override ignored");
    require(config.execution.per_test_case_deadline_ms == 120000,
            "non-numeric override should be ignored");
    require(config.observability.backend == "none", "backend override should be normalized");
  }});

  tests.push_back({"config_wide_integers_are_not_truncated", [] {
    for (const std::string key : {"retry]\nmax_retries", "execution]\nmax_concurrent_test_cases",
                                  "replay]\nruns"}) {
      const auto parsed = healrun::config::parse_config("[" + key + " = 4294967297\n");
      require(!parsed.ok(), "value above 32 bits accepted for " + key);
      const std::string name = key.substr(key.find('\n') + 1);
      require(parsed.error().find(name) != std::string::npos, "error should name " + name);
    }

    EnvGuard retries("HEALRUN_MAX_RETRIES", std::string("4294967297"));
    healrun::config::Config config;
    const auto status = healrun::config::apply_env_overrides(config);
    require(!status.ok(), "oversized env override accepted");
    require(status.error().find("HEALRUN_MAX_RETRIES") != std::string::npos,
            "error should name the variable");
    require(config.retry.max_retries == 3, "rejected override must not change the value");
  }});

  tests.push_back({"config_validate_rejects_oversized_durations", [] {
    healrun::config::Config config;
    config.execution.per_test_case_deadline_ms = 10'000'000'000'000ULL;
    const auto validated = healrun::config::validate_config(config);
    require(!validated.ok(), "unbounded deadline accepted");
    require(validated.error().find("per_test_case_deadline_ms") != std::string::npos,
            "error should name the deadline");

    healrun::config::Config probe_limit;
    probe_limit.resolver.existence_probe_timeout_ms = 86'400'001;
    require(!healrun::config::validate_config(probe_limit).ok(), "oversized probe timeout accepted");

    healrun::config::Config one_day;
    one_day.execution.per_test_case_deadline_ms = 86'400'000;
    require(healrun::config::validate_config(one_day).ok(), "a one-day deadline is allowed");
  }});

  tests.push_back({"config_load_from_override_directory", [] {
    TempDir dir("healrun-config-");
    write_file(dir.path() / "config.toml", "[retry]\nmax_retries = 2\n");
    EnvGuard retries("HEALRUN_MAX_RETRIES", std::nullopt);
    ConfigOverrideGuard guard(dir.path());

    require(healrun::config::config_exists(), "config should exist");
    const auto path = healrun::config::config_path();
    require(path.ok() && path.value() == dir.path() / "config.toml", "config path mismatch");
    const auto loaded = healrun::config::load_config();
    require(loaded.ok(), loaded.ok() ? "" : loaded.error());
    require(loaded.value().retry.max_retries == 2, "loaded value mismatch");
  }});

  tests.push_back({"config_load_missing_file_uses_defaults", [] {
    TempDir dir("healrun-config-");
    EnvGuard retries("HEALRUN_MAX_RETRIES", std::nullopt);
    ConfigOverrideGuard guard(dir.path() / "absent.toml");
    const auto loaded = healrun::config::load_config();
    require(loaded.ok(), "missing config should fall back to defaults");
    require(loaded.value().retry.max_retries == 3, "default expected");
  }});

  tests.push_back({"config_load_env_path", [] {
    TempDir dir("healrun-config-");
    write_file(dir.path() / "custom.toml", "[execution]\nmax_concurrent_test_cases = 6\n");
    ConfigOverrideGuard guard;
    EnvGuard width("HEALRUN_MAX_CONCURRENCY", std::nullopt);
    EnvGuard path("HEALRUN_CONFIG_PATH", (dir.path() / "custom.toml").string());
    const auto loaded = healrun::config::load_config();
    require(loaded.ok(), loaded.ok() ? "" : loaded.error());
    require(loaded.value().execution.max_concurrent_test_cases == 6, "env path not honored");
  }});

  tests.push_back({"config_schema_mentions_every_section", [] {
    const std::string schema = healrun::config::json_schema();
    for (const char *key : {"retry", "resolver", "ranker", "execution", "replay", "observability",
                            "fallbacks", "existence_probe_timeout_ms", "freshness_window_ms"}) {
      require(schema.find(key) != std::string::npos, std::string("schema missing ") + key);
    }
  }});

  tests.push_back({"config_observer_backend_selection", [] {
    healrun::config::Config config;
    require(healrun::observability::create_observer(config)->name() == "log", "log expected");
    config.observability.backend = "none";
    require(healrun::observability::create_observer(config)->name() == "none", "none expected");
  }});

  tests.push_back({"config_fallback_pools_merge", [] {
    const auto builtin = healrun::selectors::builtin_fallback_pools();
    require(builtin.size() == 3, "expected three built-in pools");

    std::vector<healrun::config::FallbackPoolConfig> configured;
    configured.push_back({.id = "password", .candidates = {"#pw"}, .confidence = 0.3});
    configured.push_back({.id = "search", .candidates = {"#q"}, .confidence = 0.2});
    const auto merged = healrun::selectors::merge_fallback_pools(configured);
    require(merged.size() == 4, "expected three built-in plus one new pool");
    const auto password = std::find_if(merged.begin(), merged.end(),
                                       [](const auto &pool) { return pool.id == "password"; });
    require(password != merged.end(), "password pool missing");
    require(password->locators.size() == 1 && password->locators[0] == "#pw",
            "configured pool should replace built-in one");
    require(password->confidence == 0.3, "configured confidence lost");
  }});
}
