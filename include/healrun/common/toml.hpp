#pragma once

#include "healrun/common/result.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace healrun::common {

enum class TomlKind { String, Integer, Float, Bool, Array };

struct TomlValue {
  TomlKind kind = TomlKind::String;
  // Scalars keep their decoded text; arrays keep one decoded entry per item.
  std::string text;
  std::vector<std::string> items;
};

/// Flattened TOML document: `[a.b]` + `c = 1` is stored under "a.b.c".
struct TomlDocument {
  std::unordered_map<std::string, TomlValue> values;

  [[nodiscard]] bool has(const std::string &key) const;
  [[nodiscard]] std::string get_string(const std::string &key,
                                       const std::string &fallback = "") const;
  [[nodiscard]] std::uint64_t get_u64(const std::string &key, std::uint64_t fallback = 0) const;
  [[nodiscard]] double get_double(const std::string &key, double fallback = 0.0) const;
  [[nodiscard]] bool get_bool(const std::string &key, bool fallback = false) const;
  [[nodiscard]] std::vector<std::string>
  get_string_array(const std::string &key, const std::vector<std::string> &fallback = {}) const;
};

/// Parses the subset of TOML used by config files: tables, dotted keys,
/// basic/literal strings, integers, floats, booleans and flat arrays.
[[nodiscard]] Result<TomlDocument> parse_toml(std::string_view text);

} // namespace healrun::common
