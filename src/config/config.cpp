#include "healrun/config/config.hpp"

#include "healrun/common/fs.hpp"
#include "healrun/common/toml.hpp"

#include <cstdlib>
#include <exception>
#include <fstream>
#include <limits>
#include <set>
#include <sstream>
#include <utility>

namespace healrun::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".healrun";
constexpr const char *CONFIG_FILENAME = "config.toml";
// Upper bound for every duration setting: one day.
constexpr std::uint64_t MAX_DURATION_MS = 86'400'000;
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return std::filesystem::path(common::expand_path(g_config_path_override->string()));
  }
  if (const char *env = std::getenv("HEALRUN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

common::Result<std::string> read_config_file(const std::filesystem::path &path) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    return common::Result<std::string>::failure("Unable to open config file: " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();
  return common::Result<std::string>::success(buffer.str());
}

std::optional<std::uint64_t> env_u64(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0') {
    return std::nullopt;
  }
  try {
    std::size_t consumed = 0;
    const std::string text = common::trim(raw);
    const auto value = std::stoull(text, &consumed);
    if (consumed != text.size()) {
      return std::nullopt;
    }
    return value;
  } catch (const std::exception &) {
    return std::nullopt;
  }
}

common::Status narrow_u32(const std::string &key, const std::uint64_t value, std::uint32_t &out) {
  if (value > std::numeric_limits<std::uint32_t>::max()) {
    return common::Status::error(key + " is out of range: " + std::to_string(value));
  }
  out = static_cast<std::uint32_t>(value);
  return common::Status::success();
}

void load_fallback_config(Config &config, const common::TomlDocument &doc) {
  // Discover pool IDs by scanning keys of the form "fallbacks.<id>.<field>".
  std::set<std::string> pool_ids;
  for (const auto &[key, val] : doc.values) {
    if (common::starts_with(key, "fallbacks.")) {
      const auto after = key.substr(10);
      const auto dot = after.find('.');
      if (dot != std::string::npos) {
        pool_ids.insert(after.substr(0, dot));
      }
    }
  }

  for (const auto &id : pool_ids) {
    FallbackPoolConfig pool;
    pool.id = id;
    const std::string prefix = "fallbacks." + id + ".";
    pool.candidates = doc.get_string_array(prefix + "candidates");
    pool.confidence = doc.get_double(prefix + "confidence", pool.confidence);
    config.fallbacks.push_back(std::move(pool));
  }
}

common::Result<Config> config_from_document(const common::TomlDocument &doc) {
  Config config;

  const std::pair<const char *, std::uint32_t *> narrow_fields[] = {
      {"retry.max_retries", &config.retry.max_retries},
      {"execution.max_concurrent_test_cases", &config.execution.max_concurrent_test_cases},
      {"replay.runs", &config.replay.runs},
  };
  for (const auto &[key, field] : narrow_fields) {
    const auto status = narrow_u32(key, doc.get_u64(key, *field), *field);
    if (!status.ok()) {
      return common::Result<Config>::failure(status.error());
    }
  }

  config.retry.backoff_base_ms = doc.get_u64("retry.backoff_base_ms", config.retry.backoff_base_ms);
  config.retry.backoff_cap_ms = doc.get_u64("retry.backoff_cap_ms", config.retry.backoff_cap_ms);

  config.resolver.existence_probe_timeout_ms = doc.get_u64(
      "resolver.existence_probe_timeout_ms", config.resolver.existence_probe_timeout_ms);

  config.ranker.freshness_window_ms =
      doc.get_u64("ranker.freshness_window_ms", config.ranker.freshness_window_ms);
  config.ranker.recency_bonus = doc.get_double("ranker.recency_bonus", config.ranker.recency_bonus);

  config.execution.per_test_case_deadline_ms = doc.get_u64(
      "execution.per_test_case_deadline_ms", config.execution.per_test_case_deadline_ms);
  config.execution.post_action_settle_ms =
      doc.get_u64("execution.post_action_settle_ms", config.execution.post_action_settle_ms);
  config.execution.isolate_candidate_stores = doc.get_bool(
      "execution.isolate_candidate_stores", config.execution.isolate_candidate_stores);

  config.replay.rerun_failed = doc.get_bool("replay.rerun_failed", config.replay.rerun_failed);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);

  load_fallback_config(config, doc);
  return common::Result<Config>::success(std::move(config));
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    std::filesystem::path candidate = *override_path;
    if (std::filesystem::is_directory(candidate, ec) || candidate.filename().empty()) {
      return common::ensure_dir(candidate);
    }

    auto parent = candidate.parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }

  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  return path.ok() && std::filesystem::exists(path.value());
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::optional<std::filesystem::path> config_path_override() {
  return resolved_config_path_override();
}

common::Status apply_env_overrides(Config &config) {
  if (const auto retries = env_u64("HEALRUN_MAX_RETRIES"); retries.has_value()) {
    auto status = narrow_u32("HEALRUN_MAX_RETRIES", *retries, config.retry.max_retries);
    if (!status.ok()) {
      return status;
    }
  }
  if (const auto width = env_u64("HEALRUN_MAX_CONCURRENCY"); width.has_value()) {
    auto status =
        narrow_u32("HEALRUN_MAX_CONCURRENCY", *width, config.execution.max_concurrent_test_cases);
    if (!status.ok()) {
      return status;
    }
  }
  if (const auto deadline = env_u64("HEALRUN_DEADLINE_MS"); deadline.has_value()) {
    config.execution.per_test_case_deadline_ms = *deadline;
  }
  if (const char *backend = std::getenv("HEALRUN_OBSERVABILITY");
      backend != nullptr && *backend != '\0') {
    config.observability.backend = common::to_lower(common::trim(backend));
  }
  return common::Status::success();
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.error());
  }
  return config_from_document(parsed.value());
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    const auto env = apply_env_overrides(config);
    if (!env.ok()) {
      return common::Result<Config>::failure(env.error());
    }
    return common::Result<Config>::success(std::move(config));
  }

  auto text = read_config_file(path);
  if (!text.ok()) {
    return common::Result<Config>::failure(text.error());
  }

  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.string() + ": " + config.error());
  }
  const auto env = apply_env_overrides(config.value());
  if (!env.ok()) {
    return common::Result<Config>::failure(env.error());
  }
  return config;
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  std::vector<std::string> warnings;

  if (config.retry.max_retries > 20) {
    return common::Result<std::vector<std::string>>::failure(
        "retry.max_retries must be at most 20");
  }
  if (config.retry.backoff_cap_ms < config.retry.backoff_base_ms) {
    return common::Result<std::vector<std::string>>::failure(
        "retry.backoff_cap_ms must be >= retry.backoff_base_ms");
  }
  const std::pair<const char *, std::uint64_t> durations[] = {
      {"retry.backoff_cap_ms", config.retry.backoff_cap_ms},
      {"resolver.existence_probe_timeout_ms", config.resolver.existence_probe_timeout_ms},
      {"execution.per_test_case_deadline_ms", config.execution.per_test_case_deadline_ms},
      {"execution.post_action_settle_ms", config.execution.post_action_settle_ms},
  };
  for (const auto &[key, value] : durations) {
    if (value > MAX_DURATION_MS) {
      return common::Result<std::vector<std::string>>::failure(
          std::string(key) + " must be at most " + std::to_string(MAX_DURATION_MS));
    }
  }
  if (config.resolver.existence_probe_timeout_ms == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "resolver.existence_probe_timeout_ms must be positive");
  }
  if (config.ranker.recency_bonus < 0.0 || config.ranker.recency_bonus > 1.0) {
    return common::Result<std::vector<std::string>>::failure(
        "ranker.recency_bonus must be between 0.0 and 1.0");
  }
  if (config.execution.max_concurrent_test_cases == 0) {
    return common::Result<std::vector<std::string>>::failure(
        "execution.max_concurrent_test_cases must be at least 1");
  }
  if (config.replay.runs == 0) {
    return common::Result<std::vector<std::string>>::failure("replay.runs must be at least 1");
  }

  const std::string backend = common::to_lower(config.observability.backend);
  if (backend != "log" && backend != "none") {
    return common::Result<std::vector<std::string>>::failure("Invalid observability.backend: " +
                                                              config.observability.backend);
  }

  for (const auto &pool : config.fallbacks) {
    if (pool.candidates.empty()) {
      warnings.push_back("fallbacks." + pool.id + " declares no candidates");
    }
    if (pool.confidence < 0.0 || pool.confidence > 1.0) {
      return common::Result<std::vector<std::string>>::failure(
          "fallbacks." + pool.id + ".confidence must be between 0.0 and 1.0");
    }
  }

  if (config.execution.per_test_case_deadline_ms > 0 &&
      config.execution.per_test_case_deadline_ms <
          config.resolver.existence_probe_timeout_ms + config.retry.backoff_base_ms) {
    warnings.push_back(
        "execution.per_test_case_deadline_ms is shorter than one probe plus one backoff");
  }

  return common::Result<std::vector<std::string>>::success(std::move(warnings));
}

} // namespace healrun::config
