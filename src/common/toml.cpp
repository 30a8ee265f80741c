#include "healrun/common/toml.hpp"

#include "healrun/common/fs.hpp"

#include <cctype>
#include <exception>

namespace healrun::common {

namespace {

struct Cursor {
  std::string_view text;
  std::size_t pos = 0;
  std::size_t line = 1;

  [[nodiscard]] bool done() const { return pos >= text.size(); }
  [[nodiscard]] char peek() const { return done() ? '\0' : text[pos]; }

  void advance() {
    if (!done()) {
      if (text[pos] == '\n') {
        ++line;
      }
      ++pos;
    }
  }

  void skip_inline_ws() {
    while (!done() && (peek() == ' ' || peek() == '\t')) {
      advance();
    }
  }

  // Whitespace, newlines and comments; used inside multi-line arrays.
  void skip_all_ws() {
    while (!done()) {
      const char ch = peek();
      if (ch == '#') {
        while (!done() && peek() != '\n') {
          advance();
        }
      } else if (std::isspace(static_cast<unsigned char>(ch)) != 0) {
        advance();
      } else {
        break;
      }
    }
  }
};

std::string error_at(const Cursor &cursor, const std::string &message) {
  return "toml parse error at line " + std::to_string(cursor.line) + ": " + message;
}

bool is_bare_key_char(const char ch) {
  return std::isalnum(static_cast<unsigned char>(ch)) != 0 || ch == '_' || ch == '-';
}

Result<std::string> parse_basic_string(Cursor &cursor) {
  cursor.advance(); // opening quote
  std::string out;
  while (!cursor.done()) {
    const char ch = cursor.peek();
    if (ch == '"') {
      cursor.advance();
      return Result<std::string>::success(std::move(out));
    }
    if (ch == '\n') {
      break;
    }
    if (ch == '\\') {
      cursor.advance();
      const char esc = cursor.peek();
      switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case '"':
      case '\\':
        out.push_back(esc);
        break;
      default:
        return Result<std::string>::failure(error_at(cursor, "unsupported escape sequence"));
      }
      cursor.advance();
      continue;
    }
    out.push_back(ch);
    cursor.advance();
  }
  return Result<std::string>::failure(error_at(cursor, "unterminated string"));
}

Result<std::string> parse_literal_string(Cursor &cursor) {
  cursor.advance();
  std::string out;
  while (!cursor.done() && cursor.peek() != '\'' && cursor.peek() != '\n') {
    out.push_back(cursor.peek());
    cursor.advance();
  }
  if (cursor.peek() != '\'') {
    return Result<std::string>::failure(error_at(cursor, "unterminated literal string"));
  }
  cursor.advance();
  return Result<std::string>::success(std::move(out));
}

Result<std::string> parse_key_segment(Cursor &cursor) {
  if (cursor.peek() == '"') {
    return parse_basic_string(cursor);
  }
  if (cursor.peek() == '\'') {
    return parse_literal_string(cursor);
  }
  std::string out;
  while (!cursor.done() && is_bare_key_char(cursor.peek())) {
    out.push_back(cursor.peek());
    cursor.advance();
  }
  if (out.empty()) {
    return Result<std::string>::failure(error_at(cursor, "expected key"));
  }
  return Result<std::string>::success(std::move(out));
}

Result<std::string> parse_dotted_key(Cursor &cursor) {
  std::string key;
  while (true) {
    cursor.skip_inline_ws();
    auto segment = parse_key_segment(cursor);
    if (!segment.ok()) {
      return segment;
    }
    key += segment.value();
    cursor.skip_inline_ws();
    if (cursor.peek() != '.') {
      break;
    }
    cursor.advance();
    key.push_back('.');
  }
  return Result<std::string>::success(std::move(key));
}

Result<TomlValue> parse_scalar(Cursor &cursor) {
  TomlValue value;
  const char ch = cursor.peek();
  if (ch == '"' || ch == '\'') {
    auto text = ch == '"' ? parse_basic_string(cursor) : parse_literal_string(cursor);
    if (!text.ok()) {
      return Result<TomlValue>::failure(text.error());
    }
    value.kind = TomlKind::String;
    value.text = std::move(text.value());
    return Result<TomlValue>::success(std::move(value));
  }

  std::string raw;
  while (!cursor.done()) {
    const char c = cursor.peek();
    if (c == ',' || c == ']' || c == '#' || std::isspace(static_cast<unsigned char>(c)) != 0) {
      break;
    }
    raw.push_back(c);
    cursor.advance();
  }
  if (raw.empty()) {
    return Result<TomlValue>::failure(error_at(cursor, "expected value"));
  }
  if (raw == "true" || raw == "false") {
    value.kind = TomlKind::Bool;
    value.text = raw;
    return Result<TomlValue>::success(std::move(value));
  }

  std::string digits;
  for (const char c : raw) {
    if (c != '_') {
      digits.push_back(c);
    }
  }
  try {
    std::size_t consumed = 0;
    if (digits.find_first_of(".eE") != std::string::npos) {
      (void)std::stod(digits, &consumed);
      value.kind = TomlKind::Float;
    } else {
      (void)std::stoll(digits, &consumed);
      value.kind = TomlKind::Integer;
    }
    if (consumed != digits.size()) {
      return Result<TomlValue>::failure(error_at(cursor, "invalid number: " + raw));
    }
  } catch (const std::exception &) {
    return Result<TomlValue>::failure(error_at(cursor, "invalid value: " + raw));
  }
  value.text = digits;
  return Result<TomlValue>::success(std::move(value));
}

Result<TomlValue> parse_value(Cursor &cursor) {
  if (cursor.peek() != '[') {
    return parse_scalar(cursor);
  }
  cursor.advance();
  TomlValue array;
  array.kind = TomlKind::Array;
  while (true) {
    cursor.skip_all_ws();
    if (cursor.done()) {
      return Result<TomlValue>::failure(error_at(cursor, "unterminated array"));
    }
    if (cursor.peek() == ']') {
      cursor.advance();
      break;
    }
    auto item = parse_scalar(cursor);
    if (!item.ok()) {
      return item;
    }
    array.items.push_back(std::move(item.value().text));
    cursor.skip_all_ws();
    if (cursor.peek() == ',') {
      cursor.advance();
    } else if (cursor.peek() != ']') {
      return Result<TomlValue>::failure(error_at(cursor, "expected ',' or ']' in array"));
    }
  }
  return Result<TomlValue>::success(std::move(array));
}

Status expect_line_end(Cursor &cursor) {
  cursor.skip_inline_ws();
  if (cursor.peek() == '#') {
    while (!cursor.done() && cursor.peek() != '\n') {
      cursor.advance();
    }
  }
  if (cursor.peek() == '\r') {
    cursor.advance();
  }
  if (!cursor.done() && cursor.peek() != '\n') {
    return Status::error(error_at(cursor, "unexpected trailing characters"));
  }
  cursor.advance();
  return Status::success();
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.find(key) != values.end(); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind == TomlKind::Array) {
    return fallback;
  }
  return it->second.text;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlKind::Integer ||
      starts_with(it->second.text, "-")) {
    return fallback;
  }
  try {
    return std::stoull(it->second.text);
  } catch (const std::exception &) {
    return fallback;
  }
}

double TomlDocument::get_double(const std::string &key, const double fallback) const {
  const auto it = values.find(key);
  if (it == values.end() ||
      (it->second.kind != TomlKind::Float && it->second.kind != TomlKind::Integer)) {
    return fallback;
  }
  try {
    return std::stod(it->second.text);
  } catch (const std::exception &) {
    return fallback;
  }
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlKind::Bool) {
    return fallback;
  }
  return it->second.text == "true";
}

std::vector<std::string>
TomlDocument::get_string_array(const std::string &key,
                               const std::vector<std::string> &fallback) const {
  const auto it = values.find(key);
  if (it == values.end() || it->second.kind != TomlKind::Array) {
    return fallback;
  }
  return it->second.items;
}

Result<TomlDocument> parse_toml(const std::string_view text) {
  TomlDocument doc;
  Cursor cursor{text};
  std::string table;

  while (!cursor.done()) {
    cursor.skip_inline_ws();
    const char ch = cursor.peek();
    if (ch == '\n' || ch == '\r' || ch == '#') {
      auto end = expect_line_end(cursor);
      if (!end.ok()) {
        return Result<TomlDocument>::failure(end.error());
      }
      continue;
    }
    if (cursor.done()) {
      break;
    }

    if (ch == '[') {
      cursor.advance();
      auto name = parse_dotted_key(cursor);
      if (!name.ok()) {
        return Result<TomlDocument>::failure(name.error());
      }
      if (cursor.peek() != ']') {
        return Result<TomlDocument>::failure(error_at(cursor, "expected ']' after table name"));
      }
      cursor.advance();
      table = name.value();
      auto end = expect_line_end(cursor);
      if (!end.ok()) {
        return Result<TomlDocument>::failure(end.error());
      }
      continue;
    }

    auto key = parse_dotted_key(cursor);
    if (!key.ok()) {
      return Result<TomlDocument>::failure(key.error());
    }
    cursor.skip_inline_ws();
    if (cursor.peek() != '=') {
      return Result<TomlDocument>::failure(error_at(cursor, "expected '=' after key"));
    }
    cursor.advance();
    cursor.skip_inline_ws();

    auto value = parse_value(cursor);
    if (!value.ok()) {
      return Result<TomlDocument>::failure(value.error());
    }
    const std::string full_key = table.empty() ? key.value() : table + "." + key.value();
    if (doc.has(full_key)) {
      return Result<TomlDocument>::failure(error_at(cursor, "duplicate key: " + full_key));
    }
    doc.values[full_key] = std::move(value.value());

    auto end = expect_line_end(cursor);
    if (!end.ok()) {
      return Result<TomlDocument>::failure(end.error());
    }
  }

  return Result<TomlDocument>::success(std::move(doc));
}

} // namespace healrun::common
