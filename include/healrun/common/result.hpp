#pragma once

#include <optional>
#include <string>
#include <utility>

namespace healrun::common {

template <typename T> class Result {
public:
  [[nodiscard]] static Result success(T value) {
    Result out;
    out.value_ = std::move(value);
    return out;
  }

  [[nodiscard]] static Result failure(std::string error) {
    Result out;
    out.error_ = std::move(error);
    return out;
  }

  [[nodiscard]] bool ok() const { return value_.has_value(); }

  [[nodiscard]] T &value() { return *value_; }
  [[nodiscard]] const T &value() const { return *value_; }

  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Result() = default;

  std::optional<T> value_;
  std::string error_;
};

class Status {
public:
  [[nodiscard]] static Status success() { return Status(); }

  [[nodiscard]] static Status error(std::string message) {
    Status out;
    out.ok_ = false;
    out.error_ = std::move(message);
    return out;
  }

  [[nodiscard]] bool ok() const { return ok_; }
  [[nodiscard]] const std::string &error() const { return error_; }

private:
  Status() = default;

  bool ok_ = true;
  std::string error_;
};

} // namespace healrun::common
