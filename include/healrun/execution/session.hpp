#pragma once

#include "healrun/config/config.hpp"
#include "healrun/driver/driver.hpp"
#include "healrun/execution/types.hpp"
#include "healrun/selectors/candidate_store.hpp"

#include <cstdint>

namespace healrun::execution {

/// Executes the steps of one test case in order on a single driver session.
/// The first failed action ends the test case; the verdict is derived from
/// the actions that ran.
class SessionOrchestrator {
public:
  SessionOrchestrator(const config::Config &config, selectors::CandidateStore &store,
                      driver::IDriver &driver);

  [[nodiscard]] TestVerdict run(const TestCase &test_case, std::uint32_t run_index = 0);

private:
  const config::Config &config_;
  selectors::CandidateStore &store_;
  driver::IDriver &driver_;
};

} // namespace healrun::execution
