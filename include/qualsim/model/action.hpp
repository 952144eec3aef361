// qualsim/model/action.hpp - Actions, parameters and behaviours
#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "qualsim/model/condition.hpp"
#include "qualsim/model/effect.hpp"

namespace qualsim
{

/// Parameter name -> supplied value.
using ParameterMap = std::map<std::string, std::string>;

struct ParameterSpec
{
  std::string name;
  std::string type = "choice";
  std::vector<std::string> choices;  ///< empty: any value accepted
  bool required = true;
};

/**
 * Named operation with preconditions and effects.
 *
 * An empty `object_type` marks a generic action usable on any object type
 * that has the attributes it touches.
 */
struct Action
{
  std::string name;
  std::string object_type;
  std::string description;
  std::vector<ParameterSpec> parameters;
  std::vector<Condition> preconditions;
  std::vector<Effect> effects;

  [[nodiscard]] bool is_generic() const noexcept { return object_type.empty(); }
  [[nodiscard]] const ParameterSpec * find_parameter(std::string_view param) const;
};

/**
 * Object-type specific additions to an action of the same name.
 */
struct Behavior
{
  std::vector<Condition> preconditions;
  std::vector<Effect> effects;
};

/**
 * Checks required parameters and choice membership.
 *
 * @return An error message for the first offending parameter, or
 *         std::nullopt when the map is acceptable.
 */
[[nodiscard]] std::optional<std::string> validate_parameters(
  const Action & action, const ParameterMap & parameters);

}  // namespace qualsim
