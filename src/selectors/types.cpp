#include "healrun/selectors/types.hpp"

#include "healrun/common/fs.hpp"

namespace healrun::selectors {

std::string_view role_name(const ElementRole role) {
  switch (role) {
  case ElementRole::Input:
    return "input";
  case ElementRole::Button:
    return "button";
  case ElementRole::Link:
    return "link";
  case ElementRole::Checkbox:
    return "checkbox";
  case ElementRole::Custom:
    return "custom";
  }
  return "custom";
}

ElementRole parse_role(const std::string &name) {
  const std::string lowered = common::to_lower(common::trim(name));
  if (lowered == "input") {
    return ElementRole::Input;
  }
  if (lowered == "button") {
    return ElementRole::Button;
  }
  if (lowered == "link") {
    return ElementRole::Link;
  }
  if (lowered == "checkbox") {
    return ElementRole::Checkbox;
  }
  return ElementRole::Custom;
}

std::string_view resolution_status_name(const ResolutionStatus status) {
  switch (status) {
  case ResolutionStatus::Resolved:
    return "resolved";
  case ResolutionStatus::ResolvedWithFallback:
    return "resolved-with-fallback";
  case ResolutionStatus::Unresolved:
    return "unresolved";
  }
  return "unresolved";
}

} // namespace healrun::selectors
