// qualsim/engine/transition_engine.cpp
#include "qualsim/engine/transition_engine.hpp"

#include <fmt/core.h>

#include <utility>

#include "qualsim/engine/branch_generator.hpp"
#include "qualsim/engine/condition_evaluator.hpp"
#include "qualsim/engine/effect_applier.hpp"

namespace qualsim
{

TransitionResult TransitionEngine::failure(const WorldSnapshot & before, TransitionError error)
{
  TransitionResult r;
  r.status = NodeStatus::Error;
  r.before = before;
  r.branch_state = before.with_sequence(before.sequence() + 1);
  r.error = std::move(error);
  return r;
}

std::vector<TransitionResult> TransitionEngine::apply(
  const WorldSnapshot & before, const Action & action, const ParameterMap & parameters) const
{
  if (auto err = check_flat_structure(action.effects)) {
    err->message = fmt::format("action '{}': {}", action.name, err->message);
    return {failure(before, std::move(*err))};
  }
  if (auto msg = validate_parameters(action, parameters)) {
    return {failure(before, TransitionError{ErrorKind::Validation, std::move(*msg)})};
  }

  const ConditionEvaluator evaluator(parameters);
  const BranchGenerator generator(evaluator);
  const EffectApplier applier(type_, evaluator);
  const uint64_t next_sequence = before.sequence() + 1;

  // === Trend materialisation ===
  const WorldSnapshot working = before.materialize_trends();
  std::vector<Change> base_changes;
  for (const auto & [path, value] : before.values()) {
    record_change(base_changes, Change{path, ChangeKind::Value, value, *working.find(path)});
  }

  // === Preconditions ===
  Split pre;
  std::optional<Condition> combined;
  if (action.preconditions.empty()) {
    pre.truth = Truth::True;
    pre.success.emplace_back();
  } else {
    combined = action.preconditions.size() == 1 ? action.preconditions.front()
                                                : all_of(action.preconditions);
    pre = generator.split(*combined, working);
    if (pre.error) {
      return {failure(before, std::move(*pre.error))};
    }
  }
  const bool branched = pre.truth == Truth::Unknown;
  const auto compound =
    combined ? BranchGenerator::compound_type_of(*combined) : std::optional<CompoundType>{};

  std::vector<TransitionResult> results;

  // === Success side: effects, then constraints ===
  for (const auto & assumption : pre.success) {
    EffectBranch start{working, base_changes, {}, std::nullopt};
    if (branched) {
      start.decisions.push_back(BranchGenerator::describe_branch(
        assumption, working, ConditionSource::Precondition, BranchType::Success, compound));
      start.state = BranchGenerator::narrow(working, assumption, start.changes);
    }
    const WorldSnapshot decided = start.state.with_sequence(next_sequence);

    for (auto & branch : applier.apply(action.effects, std::move(start))) {
      TransitionResult r;
      r.before = before;
      r.changes = std::move(branch.changes);
      r.branch_conditions = std::move(branch.decisions);

      if (branch.error) {
        r.status = NodeStatus::Error;
        r.branch_state = branch.state.with_sequence(next_sequence);
        r.error = std::move(branch.error);
        results.push_back(std::move(r));
        continue;
      }

      ConstraintReport report = checker_.check(branch.state);
      r.status = report.violated() ? NodeStatus::ConstraintViolated : NodeStatus::Ok;
      r.branch_state = decided;
      r.after = branch.state.with_sequence(next_sequence);
      r.violations = std::move(report.violations);
      r.undetermined_constraints = std::move(report.undetermined);
      for (auto & mark : report.marks) {
        r.changes.push_back(std::move(mark));
      }
      results.push_back(std::move(r));
    }
  }

  // === Fail side: rejected children ===
  for (const auto & assumption : pre.fail) {
    TransitionResult r;
    r.status = NodeStatus::Rejected;
    r.before = before;
    r.changes = base_changes;
    WorldSnapshot state = working;
    if (branched) {
      r.branch_conditions.push_back(BranchGenerator::describe_branch(
        assumption, working, ConditionSource::Precondition, BranchType::Fail,
        BranchGenerator::flip(compound)));
      state = BranchGenerator::narrow(working, assumption, r.changes);
    }
    r.branch_state = state.with_sequence(next_sequence);
    r.reason = fmt::format("precondition not met: {}", describe(*combined));
    results.push_back(std::move(r));
  }

  return results;
}

}  // namespace qualsim
