#pragma once

#include "healrun/common/result.hpp"
#include "healrun/execution/types.hpp"
#include "healrun/selectors/candidate_store.hpp"
#include "healrun/selectors/types.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace healrun::execution {

/// Element descriptors and test cases produced by the crawl stage.
struct SuiteInput {
  std::vector<selectors::ElementDescriptor> descriptors;
  std::vector<TestCase> test_cases;
};

/// Parse a suite document:
///   {"descriptors": [{"id", "role", "fallback_pool",
///                     "candidates": [{"locator", "confidence", "last_known_good_ms"}]}],
///    "test_cases": [{"id", "steps": [{"action", "target", "value"}]}]}
[[nodiscard]] common::Result<SuiteInput> parse_suite_json(const std::string &json);

[[nodiscard]] common::Result<SuiteInput> load_suite_file(const std::filesystem::path &path);

/// Admit every descriptor into `store`; stops at the first rejection.
[[nodiscard]] common::Status populate_store(selectors::CandidateStore &store,
                                            const std::vector<selectors::ElementDescriptor> &descriptors);

} // namespace healrun::execution
