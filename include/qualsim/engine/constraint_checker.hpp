// qualsim/engine/constraint_checker.hpp - Dependency rule checking
#pragma once

#include <string>
#include <vector>

#include "qualsim/engine/transition.hpp"
#include "qualsim/model/object_type.hpp"
#include "qualsim/model/snapshot.hpp"

namespace qualsim
{

struct ConstraintReport
{
  std::vector<std::string> violations;
  /// Rules whose outcome depends on unresolved uncertainty.
  std::vector<std::string> undetermined;
  /// One Constraint change per attribute read by a violated requirement.
  std::vector<Change> marks;

  [[nodiscard]] bool violated() const noexcept { return !violations.empty(); }
};

/**
 * Checks an object type's dependency rules against a snapshot.
 *
 * A rule is violated when its condition is True and its requirement
 * False. If either side is Unknown (and the condition is not False) the
 * rule is reported as undetermined and does not count as a violation.
 */
class ConstraintChecker
{
public:
  explicit ConstraintChecker(const ObjectType & type) : type_(type) {}

  [[nodiscard]] ConstraintReport check(const WorldSnapshot & snapshot) const;

private:
  const ObjectType & type_;
};

}  // namespace qualsim
