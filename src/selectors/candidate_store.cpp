#include "healrun/selectors/candidate_store.hpp"

#include "healrun/common/fs.hpp"
#include "healrun/observability/global.hpp"

#include <algorithm>
#include <cmath>

namespace healrun::selectors {

CandidateStore::CandidateStore(std::vector<FallbackPool> pools) : pools_(std::move(pools)) {}

CandidateStore::CandidateStore(const CandidateStore &other) {
  std::lock_guard<std::mutex> lock(other.mutex_);
  pools_ = other.pools_;
  descriptors_ = other.descriptors_;
  order_ = other.order_;
}

common::Status CandidateStore::add(ElementDescriptor descriptor) {
  descriptor.id = common::trim(descriptor.id);
  if (descriptor.id.empty()) {
    return common::Status::error("element descriptor id is required");
  }

  for (const auto &candidate : descriptor.candidates) {
    if (common::trim(candidate.locator).empty()) {
      return common::Status::error("descriptor " + descriptor.id + " has an empty locator");
    }
    if (!std::isfinite(candidate.confidence) || candidate.confidence < 0.0 ||
        candidate.confidence > 1.0) {
      return common::Status::error("descriptor " + descriptor.id + " candidate " +
                                   candidate.locator + " has confidence outside [0, 1]");
    }
  }

  if (!descriptor.fallback_pool.empty()) {
    const auto pool = std::find_if(pools_.begin(), pools_.end(), [&](const FallbackPool &p) {
      return p.id == descriptor.fallback_pool;
    });
    if (pool == pools_.end()) {
      observability::record_warning("candidates", "descriptor " + descriptor.id +
                                                      " names unknown fallback pool '" +
                                                      descriptor.fallback_pool + "'");
    } else {
      for (const auto &locator : pool->locators) {
        const bool declared =
            std::any_of(descriptor.candidates.begin(), descriptor.candidates.end(),
                        [&](const SelectorCandidate &c) { return c.locator == locator; });
        if (!declared) {
          descriptor.candidates.push_back({.locator = locator, .confidence = pool->confidence});
        }
      }
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (descriptors_.find(descriptor.id) != descriptors_.end()) {
    return common::Status::error("duplicate element descriptor: " + descriptor.id);
  }
  order_.push_back(descriptor.id);
  const std::string id = descriptor.id;
  descriptors_.emplace(id, std::move(descriptor));
  return common::Status::success();
}

bool CandidateStore::contains(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return descriptors_.find(id) != descriptors_.end();
}

std::size_t CandidateStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return descriptors_.size();
}

std::vector<std::string> CandidateStore::ids() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return order_;
}

std::optional<ElementDescriptor> CandidateStore::snapshot(const std::string &id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = descriptors_.find(id);
  if (it == descriptors_.end()) {
    return std::nullopt;
  }
  return it->second;
}

common::Status CandidateStore::mark_success(const std::string &id, const std::size_t index,
                                            const std::int64_t timestamp_ms) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = descriptors_.find(id);
  if (it == descriptors_.end()) {
    return common::Status::error("unknown element descriptor: " + id);
  }
  auto &candidates = it->second.candidates;
  if (index >= candidates.size()) {
    return common::Status::error("candidate index out of range for " + id);
  }
  auto &stamp = candidates[index].last_known_good_ms;
  if (!stamp.has_value() || *stamp < timestamp_ms) {
    stamp = timestamp_ms;
  }
  return common::Status::success();
}

} // namespace healrun::selectors
