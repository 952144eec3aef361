// qualsim/engine/effect_applier.hpp - Applying postconditions with branching
#pragma once

#include <gsl/span>
#include <optional>
#include <vector>

#include "qualsim/engine/branch_generator.hpp"
#include "qualsim/engine/condition_evaluator.hpp"
#include "qualsim/engine/transition.hpp"
#include "qualsim/model/effect.hpp"
#include "qualsim/model/object_type.hpp"

namespace qualsim
{

/**
 * State of one branch while effects are being applied.
 * A branch with `error` set is finished and is passed through unchanged.
 */
struct EffectBranch
{
  WorldSnapshot state;
  std::vector<Change> changes;
  std::vector<BranchCondition> decisions;
  std::optional<TransitionError> error;
};

/**
 * Applies effect lists, forking a branch whenever a conditional effect
 * cannot be decided.
 *
 * A conditional chain `if A / elif B / else` over an uncertain attribute
 * yields one branch per arm that some level can reach. Each arm sees the
 * attribute narrowed by the arms before it, so later arms observe the
 * intersection of every assumption made so far.
 */
class EffectApplier
{
public:
  EffectApplier(const ObjectType & type, const ConditionEvaluator & evaluator);

  [[nodiscard]] std::vector<EffectBranch> apply(
    gsl::span<const Effect> effects, EffectBranch start) const;

private:
  void apply_effect(const Effect & effect, EffectBranch branch, std::vector<EffectBranch> & out) const;

  void apply_conditional(
    const ConditionalEffect & conditional, EffectBranch branch, std::vector<EffectBranch> & out,
    std::optional<BranchCondition> pending, bool in_chain) const;

  void apply_else(
    const ConditionalEffect & conditional, EffectBranch branch, std::vector<EffectBranch> & out) const;

  void apply_set(const SetAttributeEffect & effect, EffectBranch & branch) const;
  void apply_trend(const SetTrendEffect & effect, EffectBranch & branch) const;

  /// Mutable attribute spec for @p path, or an error on @p branch.
  const AttributeSpec * writable(const AttributePath & path, EffectBranch & branch) const;

  const ObjectType & type_;
  const ConditionEvaluator & evaluator_;
  BranchGenerator generator_;
};

/**
 * Rejects conditionals nested inside another conditional that read an
 * attribute the enclosing condition does not read.
 */
[[nodiscard]] std::optional<TransitionError> check_flat_structure(
  gsl::span<const Effect> effects);

}  // namespace qualsim
