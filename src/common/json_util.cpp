#include "healrun/common/json_util.hpp"

#include <cctype>
#include <cstdint>
#include <cstdio>
#include <exception>

namespace healrun::common {

namespace {

std::size_t value_end(const std::string &json, std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end;
}

// Start of the value bound to `key` at the top level of an object, or npos.
std::size_t find_value_start(const std::string &json, const std::string &key) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::string::npos;
  }
  ++pos;
  while (true) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      return std::string::npos;
    }
    if (json[pos] != '"') {
      return std::string::npos;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return std::string::npos;
    }
    const std::string current = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return std::string::npos;
    }
    pos = json_skip_ws(json, pos + 1);
    if (current == key) {
      return pos;
    }
    const auto end = value_end(json, pos);
    if (end == std::string::npos) {
      return std::string::npos;
    }
    pos = json_skip_ws(json, end);
    if (pos < json.size() && json[pos] == ',') {
      ++pos;
    }
  }
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string out;
  out.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
        out += buf;
      } else {
        out.push_back(ch);
      }
      break;
    }
  }
  return out;
}

std::string json_unescape(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (std::size_t i = 0; i < value.size(); ++i) {
    const char ch = value[i];
    if (ch != '\\' || i + 1 >= value.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = value[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u':
      if (i + 4 < value.size()) {
        try {
          const auto cp = static_cast<std::uint32_t>(std::stoul(value.substr(i + 1, 4), nullptr, 16));
          append_utf8(out, cp);
          i += 4;
        } catch (const std::exception &) {
          out.push_back('u');
        }
      } else {
        out.push_back('u');
      }
      break;
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &json, std::size_t pos) {
  while (pos < json.size() && std::isspace(static_cast<unsigned char>(json[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_find_string_end(const std::string &json, std::size_t pos) {
  if (pos >= json.size() || json[pos] != '"') {
    return std::string::npos;
  }
  for (std::size_t i = pos + 1; i < json.size(); ++i) {
    if (json[i] == '\\') {
      ++i;
      continue;
    }
    if (json[i] == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t pos, const char open,
                                     const char close) {
  if (pos >= json.size() || json[pos] != open) {
    return std::string::npos;
  }
  int depth = 0;
  for (std::size_t i = pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const auto end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        return std::string::npos;
      }
      i = end;
      continue;
    }
    if (ch == open) {
      ++depth;
    } else if (ch == close) {
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::string json_get_string(const std::string &object_json, const std::string &key) {
  const auto start = find_value_start(object_json, key);
  if (start == std::string::npos || object_json[start] != '"') {
    return "";
  }
  const auto end = json_find_string_end(object_json, start);
  if (end == std::string::npos) {
    return "";
  }
  return json_unescape(object_json.substr(start + 1, end - start - 1));
}

std::string json_get_number(const std::string &object_json, const std::string &key) {
  const auto start = find_value_start(object_json, key);
  if (start == std::string::npos) {
    return "";
  }
  const char first = object_json[start];
  if (first != '-' && std::isdigit(static_cast<unsigned char>(first)) == 0) {
    return "";
  }
  const auto end = value_end(object_json, start);
  return object_json.substr(start, end - start);
}

std::string json_get_object(const std::string &object_json, const std::string &key) {
  const auto start = find_value_start(object_json, key);
  if (start == std::string::npos || object_json[start] != '{') {
    return "";
  }
  const auto end = json_find_matching_token(object_json, start, '{', '}');
  if (end == std::string::npos) {
    return "";
  }
  return object_json.substr(start, end - start + 1);
}

std::string json_get_array(const std::string &object_json, const std::string &key) {
  const auto start = find_value_start(object_json, key);
  if (start == std::string::npos || object_json[start] != '[') {
    return "";
  }
  const auto end = json_find_matching_token(object_json, start, '[', ']');
  if (end == std::string::npos) {
    return "";
  }
  return object_json.substr(start, end - start + 1);
}

bool json_has_key(const std::string &object_json, const std::string &key) {
  return find_value_start(object_json, key) != std::string::npos;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return out;
  }
  ++pos;
  while (pos < array_json.size()) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_json[pos] != '{') {
      const auto end = value_end(array_json, pos);
      if (end == std::string::npos) {
        break;
      }
      pos = end;
      continue;
    }
    const auto end = json_find_matching_token(array_json, pos, '{', '}');
    if (end == std::string::npos) {
      break;
    }
    out.push_back(array_json.substr(pos, end - pos + 1));
    pos = end + 1;
  }
  return out;
}

} // namespace healrun::common
