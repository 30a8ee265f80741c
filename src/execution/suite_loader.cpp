#include "healrun/execution/suite_loader.hpp"

#include "healrun/common/fs.hpp"
#include "healrun/common/json_util.hpp"

#include <cmath>
#include <exception>
#include <fstream>
#include <sstream>

namespace healrun::execution {

namespace {

common::Result<double> parse_confidence(const std::string &raw, const std::string &context) {
  if (raw.empty()) {
    return common::Result<double>::success(1.0);
  }
  try {
    std::size_t consumed = 0;
    const double value = std::stod(raw, &consumed);
    if (consumed != raw.size()) {
      return common::Result<double>::failure(context + ": invalid confidence '" + raw + "'");
    }
    if (!std::isfinite(value) || value < 0.0 || value > 1.0) {
      return common::Result<double>::failure(context + ": confidence " + raw +
                                             " is outside [0, 1]");
    }
    return common::Result<double>::success(value);
  } catch (const std::exception &) {
    return common::Result<double>::failure(context + ": invalid confidence '" + raw + "'");
  }
}

common::Result<selectors::ElementDescriptor> parse_descriptor(const std::string &object) {
  selectors::ElementDescriptor descriptor;
  descriptor.id = common::trim(common::json_get_string(object, "id"));
  if (descriptor.id.empty()) {
    return common::Result<selectors::ElementDescriptor>::failure("descriptor without id");
  }
  descriptor.role = selectors::parse_role(common::json_get_string(object, "role"));
  descriptor.fallback_pool = common::trim(common::json_get_string(object, "fallback_pool"));

  const std::string candidates = common::json_get_array(object, "candidates");
  for (const auto &entry : common::json_split_top_level_objects(candidates)) {
    selectors::SelectorCandidate candidate;
    candidate.locator = common::trim(common::json_get_string(entry, "locator"));
    if (candidate.locator.empty()) {
      return common::Result<selectors::ElementDescriptor>::failure(
          "descriptor " + descriptor.id + ": candidate without locator");
    }
    auto confidence =
        parse_confidence(common::json_get_number(entry, "confidence"), "descriptor " + descriptor.id);
    if (!confidence.ok()) {
      return common::Result<selectors::ElementDescriptor>::failure(confidence.error());
    }
    candidate.confidence = confidence.value();

    const std::string last_good = common::json_get_number(entry, "last_known_good_ms");
    if (!last_good.empty()) {
      try {
        candidate.last_known_good_ms = std::stoll(last_good);
      } catch (const std::exception &) {
        return common::Result<selectors::ElementDescriptor>::failure(
            "descriptor " + descriptor.id + ": invalid last_known_good_ms '" + last_good + "'");
      }
    }
    descriptor.candidates.push_back(std::move(candidate));
  }
  return common::Result<selectors::ElementDescriptor>::success(std::move(descriptor));
}

common::Result<TestCase> parse_test_case(const std::string &object) {
  TestCase test_case;
  test_case.id = common::trim(common::json_get_string(object, "id"));
  if (test_case.id.empty()) {
    return common::Result<TestCase>::failure("test case without id");
  }

  const std::string steps = common::json_get_array(object, "steps");
  for (const auto &entry : common::json_split_top_level_objects(steps)) {
    const std::string action = common::json_get_string(entry, "action");
    const auto kind = parse_action_kind(action);
    if (!kind.has_value()) {
      return common::Result<TestCase>::failure("test case " + test_case.id +
                                               ": unknown action '" + action + "'");
    }
    TestStep step;
    step.kind = *kind;
    step.target = common::trim(common::json_get_string(entry, "target"));
    step.value = common::json_get_string(entry, "value");
    if (step.kind == ActionKind::Navigate && step.value.empty()) {
      step.value = common::json_get_string(entry, "url");
    }
    if (step.kind != ActionKind::Navigate && step.target.empty()) {
      return common::Result<TestCase>::failure("test case " + test_case.id + ": " +
                                               std::string(action_kind_name(step.kind)) +
                                               " step without target");
    }
    test_case.steps.push_back(std::move(step));
  }
  return common::Result<TestCase>::success(std::move(test_case));
}

} // namespace

common::Result<SuiteInput> parse_suite_json(const std::string &json) {
  const std::string trimmed = common::trim(json);
  if (trimmed.empty() || trimmed.front() != '{') {
    return common::Result<SuiteInput>::failure("suite document must be a JSON object");
  }

  SuiteInput input;
  for (const auto &object :
       common::json_split_top_level_objects(common::json_get_array(trimmed, "descriptors"))) {
    auto descriptor = parse_descriptor(object);
    if (!descriptor.ok()) {
      return common::Result<SuiteInput>::failure(descriptor.error());
    }
    input.descriptors.push_back(std::move(descriptor.value()));
  }
  for (const auto &object :
       common::json_split_top_level_objects(common::json_get_array(trimmed, "test_cases"))) {
    auto test_case = parse_test_case(object);
    if (!test_case.ok()) {
      return common::Result<SuiteInput>::failure(test_case.error());
    }
    input.test_cases.push_back(std::move(test_case.value()));
  }
  return common::Result<SuiteInput>::success(std::move(input));
}

common::Result<SuiteInput> load_suite_file(const std::filesystem::path &path) {
  std::ifstream in(path);
  if (!in) {
    return common::Result<SuiteInput>::failure("failed to open suite file: " + path.string());
  }
  std::stringstream buffer;
  buffer << in.rdbuf();
  auto parsed = parse_suite_json(buffer.str());
  if (!parsed.ok()) {
    return common::Result<SuiteInput>::failure(path.string() + ": " + parsed.error());
  }
  return parsed;
}

common::Status populate_store(selectors::CandidateStore &store,
                              const std::vector<selectors::ElementDescriptor> &descriptors) {
  for (const auto &descriptor : descriptors) {
    auto status = store.add(descriptor);
    if (!status.ok()) {
      return status;
    }
  }
  return common::Status::success();
}

} // namespace healrun::execution
