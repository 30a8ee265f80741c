#include "healrun/common/fs.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace healrun::common {

namespace {

bool is_env_name_char(const char ch) {
  const auto uch = static_cast<unsigned char>(ch);
  return std::isalnum(uch) != 0 || ch == '_';
}

std::string env_or_empty(const std::string &name) {
  if (name.empty()) {
    return "";
  }
  const char *value = std::getenv(name.c_str());
  return value == nullptr ? std::string() : std::string(value);
}

} // namespace

std::string trim(const std::string &value) {
  const auto begin = std::find_if_not(value.begin(), value.end(), [](const char ch) {
    return std::isspace(static_cast<unsigned char>(ch)) != 0;
  });
  const auto end = std::find_if_not(value.rbegin(), value.rend(), [](const char ch) {
                     return std::isspace(static_cast<unsigned char>(ch)) != 0;
                   }).base();
  if (begin >= end) {
    return "";
  }
  return std::string(begin, end);
}

std::string to_lower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(), [](const unsigned char ch) {
    return static_cast<char>(std::tolower(ch));
  });
  return value;
}

bool starts_with(const std::string &value, const std::string &prefix) {
  return value.size() >= prefix.size() && value.compare(0, prefix.size(), prefix) == 0;
}

bool ends_with(const std::string &value, const std::string &suffix) {
  return value.size() >= suffix.size() &&
         value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::string expand_path(const std::string &path) {
  std::string out;
  out.reserve(path.size());

  std::size_t i = 0;
  if (!path.empty() && path[0] == '~' && (path.size() == 1 || path[1] == '/')) {
    const auto home = home_dir();
    if (home.ok()) {
      out += home.value().string();
      i = 1;
    }
  }

  while (i < path.size()) {
    const char ch = path[i];
    if (ch != '$' || i + 1 >= path.size()) {
      out.push_back(ch);
      ++i;
      continue;
    }
    if (path[i + 1] == '{') {
      const auto close = path.find('}', i + 2);
      if (close == std::string::npos) {
        out.append(path, i, std::string::npos);
        break;
      }
      out += env_or_empty(path.substr(i + 2, close - i - 2));
      i = close + 1;
      continue;
    }
    std::size_t end = i + 1;
    while (end < path.size() && is_env_name_char(path[end])) {
      ++end;
    }
    if (end == i + 1) {
      out.push_back(ch);
      ++i;
      continue;
    }
    out += env_or_empty(path.substr(i + 1, end - i - 1));
    i = end;
  }
  return out;
}

std::string expand_env_placeholders(const std::string &value) {
  if (value.find("${") == std::string::npos) {
    return value;
  }
  std::string out;
  out.reserve(value.size());
  std::size_t i = 0;
  while (i < value.size()) {
    if (value[i] == '$' && i + 1 < value.size() && value[i + 1] == '{') {
      const auto close = value.find('}', i + 2);
      if (close != std::string::npos) {
        out += env_or_empty(value.substr(i + 2, close - i - 2));
        i = close + 1;
        continue;
      }
    }
    out.push_back(value[i]);
    ++i;
  }
  return out;
}

Result<std::filesystem::path> home_dir() {
  if (const char *home = std::getenv("HOME"); home != nullptr && *home != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(home));
  }
  if (const char *profile = std::getenv("USERPROFILE"); profile != nullptr && *profile != '\0') {
    return Result<std::filesystem::path>::success(std::filesystem::path(profile));
  }
  return Result<std::filesystem::path>::failure("unable to resolve home directory");
}

Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path) {
  std::error_code ec;
  std::filesystem::create_directories(path, ec);
  if (ec) {
    return Result<std::filesystem::path>::failure("failed to create directory " + path.string() +
                                                  ": " + ec.message());
  }
  return Result<std::filesystem::path>::success(path);
}

} // namespace healrun::common
