// qualsim/engine/constraint_checker.cpp
#include "qualsim/engine/constraint_checker.hpp"

#include <fmt/core.h>

#include "qualsim/engine/condition_evaluator.hpp"

namespace qualsim
{

ConstraintReport ConstraintChecker::check(const WorldSnapshot & snapshot) const
{
  static const ParameterMap k_no_parameters;
  const ConditionEvaluator evaluator(k_no_parameters);

  ConstraintReport report;
  for (const auto & rule : type_.constraints()) {
    const Evaluation cond = evaluator.evaluate(rule.condition, snapshot);
    if (!cond.ok()) {
      report.violations.push_back(
        fmt::format("{} (cannot evaluate: {})", rule.describe(), cond.error->message));
      continue;
    }
    if (cond.truth == Truth::False) {
      continue;
    }

    const Evaluation req = evaluator.evaluate(rule.requirement, snapshot);
    if (!req.ok()) {
      report.violations.push_back(
        fmt::format("{} (cannot evaluate: {})", rule.describe(), req.error->message));
      continue;
    }
    if (req.truth == Truth::True) {
      continue;
    }
    if (cond.truth == Truth::Unknown || req.truth == Truth::Unknown) {
      report.undetermined.push_back(rule.describe());
      continue;
    }

    report.violations.push_back(rule.describe());
    for (const auto & path : condition_targets(rule.requirement)) {
      if (const AttributeValue * v = snapshot.find(path)) {
        report.marks.push_back(Change{path, ChangeKind::Constraint, *v, *v});
      }
    }
  }
  return report;
}

}  // namespace qualsim
