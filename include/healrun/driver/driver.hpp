#pragma once

#include "healrun/common/result.hpp"

#include <chrono>
#include <string>

namespace healrun::driver {

/// The capability set the engine needs from a browser-automation backend.
/// One instance drives one independent browser session and is used from a
/// single thread at a time.
class IDriver {
public:
  virtual ~IDriver() = default;

  /// Whether `locator` matches a live element, waiting at most `timeout`.
  [[nodiscard]] virtual bool exists(const std::string &locator,
                                    std::chrono::milliseconds timeout) = 0;

  [[nodiscard]] virtual common::Status fill(const std::string &locator,
                                            const std::string &value) = 0;
  [[nodiscard]] virtual common::Status click(const std::string &locator) = 0;
  [[nodiscard]] virtual common::Status navigate(const std::string &url) = 0;

  /// Screenshot or DOM snapshot; returns a backend-defined reference.
  [[nodiscard]] virtual common::Result<std::string> capture_evidence() = 0;
};

} // namespace healrun::driver
