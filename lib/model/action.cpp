// qualsim/model/action.cpp
#include "qualsim/model/action.hpp"

#include <fmt/core.h>

#include <algorithm>

namespace qualsim
{

const ParameterSpec * Action::find_parameter(std::string_view param) const
{
  for (const auto & p : parameters) {
    if (p.name == param) {
      return &p;
    }
  }
  return nullptr;
}

std::optional<std::string> validate_parameters(
  const Action & action, const ParameterMap & parameters)
{
  for (const auto & spec : action.parameters) {
    const auto it = parameters.find(spec.name);
    if (it == parameters.end()) {
      if (spec.required) {
        return fmt::format("missing required parameter '{}' for '{}'", spec.name, action.name);
      }
      continue;
    }
    if (!spec.choices.empty() &&
        std::find(spec.choices.begin(), spec.choices.end(), it->second) == spec.choices.end()) {
      std::string allowed;
      for (const auto & c : spec.choices) {
        allowed += allowed.empty() ? c : ", " + c;
      }
      return fmt::format(
        "parameter '{}' must be one of [{}], got '{}'", spec.name, allowed, it->second);
    }
  }
  return std::nullopt;
}

}  // namespace qualsim
