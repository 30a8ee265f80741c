#pragma once

#include "healrun/driver/driver.hpp"

#include <chrono>
#include <cstddef>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <unordered_set>
#include <utility>
#include <vector>

namespace healrun::tests {

/// Scriptable in-memory page. Locators are present or absent, may appear
/// after a number of probes, and driver operations can be told to fail.
class FakeDriver final : public driver::IDriver {
public:
  void set_present(const std::string &locator, const bool present = true) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (present) {
      present_.insert(locator);
    } else {
      present_.erase(locator);
    }
  }

  /// `locator` answers absent to its first `misses` probes, present afterwards.
  void appear_after(const std::string &locator, const std::size_t misses) {
    std::lock_guard<std::mutex> lock(mutex_);
    appear_after_[locator] = misses;
  }

  /// Absent probes block for the full timeout, like a real wait-for-selector.
  void set_sleep_on_miss(const bool enabled) { sleep_on_miss_ = enabled; }

  void fail_next_clicks(const std::size_t count) { failing_clicks_ = count; }
  void fail_next_fills(const std::size_t count) { failing_fills_ = count; }
  void fail_next_navigations(const std::size_t count) { failing_navigations_ = count; }
  /// Every click after the first `count` successful ones fails.
  void fail_clicks_after(const std::size_t count) { clicks_before_breaking_ = count; }
  void set_evidence_failure(const bool fail) { evidence_fails_ = fail; }
  /// Runs at the start of every click, before its outcome is decided.
  void on_click(std::function<void()> hook) { click_hook_ = std::move(hook); }

  bool exists(const std::string &locator, const std::chrono::milliseconds timeout) override {
    bool found = false;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      ++probes_;
      probed_.push_back(locator);
      const auto pending = appear_after_.find(locator);
      if (pending != appear_after_.end()) {
        if (pending->second == 0) {
          found = true;
        } else {
          --pending->second;
        }
      } else {
        found = present_.contains(locator);
      }
    }
    if (!found && sleep_on_miss_ && timeout.count() > 0) {
      std::this_thread::sleep_for(timeout);
    }
    return found;
  }

  common::Status fill(const std::string &locator, const std::string &value) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_fills_ > 0) {
      --failing_fills_;
      return common::Status::error("element detached: " + locator);
    }
    fills_.emplace_back(locator, value);
    return common::Status::success();
  }

  common::Status click(const std::string &locator) override {
    if (click_hook_) {
      click_hook_();
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_clicks_ > 0) {
      --failing_clicks_;
      return common::Status::error("element detached: " + locator);
    }
    if (clicks_before_breaking_.has_value() && clicks_.size() >= *clicks_before_breaking_) {
      return common::Status::error("click intercepted: " + locator);
    }
    clicks_.push_back(locator);
    return common::Status::success();
  }

  common::Status navigate(const std::string &url) override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (failing_navigations_ > 0) {
      --failing_navigations_;
      return common::Status::error("navigation interrupted: " + url);
    }
    navigations_.push_back(url);
    return common::Status::success();
  }

  common::Result<std::string> capture_evidence() override {
    std::lock_guard<std::mutex> lock(mutex_);
    if (evidence_fails_) {
      return common::Result<std::string>::failure("screenshot unavailable");
    }
    ++evidence_count_;
    return common::Result<std::string>::success("evidence-" + std::to_string(evidence_count_) +
                                                ".png");
  }

  std::size_t probes() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probes_;
  }
  std::vector<std::string> probed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return probed_;
  }
  std::vector<std::string> clicks() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return clicks_;
  }
  std::vector<std::pair<std::string, std::string>> fills() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fills_;
  }
  std::vector<std::string> navigations() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return navigations_;
  }

private:
  mutable std::mutex mutex_;
  std::unordered_set<std::string> present_;
  std::unordered_map<std::string, std::size_t> appear_after_;
  bool sleep_on_miss_ = false;
  std::size_t failing_clicks_ = 0;
  std::size_t failing_fills_ = 0;
  std::size_t failing_navigations_ = 0;
  std::optional<std::size_t> clicks_before_breaking_;
  bool evidence_fails_ = false;
  std::function<void()> click_hook_;
  std::size_t evidence_count_ = 0;
  std::size_t probes_ = 0;
  std::vector<std::string> probed_;
  std::vector<std::string> clicks_;
  std::vector<std::pair<std::string, std::string>> fills_;
  std::vector<std::string> navigations_;
};

} // namespace healrun::tests
