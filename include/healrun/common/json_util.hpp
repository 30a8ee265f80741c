#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace healrun::common {

[[nodiscard]] std::string json_escape(const std::string &value);
[[nodiscard]] std::string json_unescape(const std::string &value);

[[nodiscard]] std::size_t json_skip_ws(const std::string &json, std::size_t pos);

/// Position of the closing quote of the string whose opening quote is at `pos`,
/// or npos when unterminated.
[[nodiscard]] std::size_t json_find_string_end(const std::string &json, std::size_t pos);

/// Position of the token closing the `open` token at `pos`, skipping strings.
[[nodiscard]] std::size_t json_find_matching_token(const std::string &json, std::size_t pos,
                                                   char open, char close);

// Field accessors look at the top level of `object_json` only. Missing or
// mistyped fields yield an empty result.
[[nodiscard]] std::string json_get_string(const std::string &object_json, const std::string &key);
[[nodiscard]] std::string json_get_number(const std::string &object_json, const std::string &key);
[[nodiscard]] std::string json_get_object(const std::string &object_json, const std::string &key);
[[nodiscard]] std::string json_get_array(const std::string &object_json, const std::string &key);
[[nodiscard]] bool json_has_key(const std::string &object_json, const std::string &key);

/// Split a JSON array of objects into the raw text of each object.
[[nodiscard]] std::vector<std::string> json_split_top_level_objects(const std::string &array_json);

} // namespace healrun::common
