// qualsim/engine/effect_applier.cpp
#include "qualsim/engine/effect_applier.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <type_traits>
#include <utility>

namespace qualsim
{

namespace
{

template <typename>
inline constexpr bool always_false_v = false;

std::optional<TransitionError> check_nested(
  gsl::span<const Effect> effects, const std::vector<AttributePath> * enclosing)
{
  for (const auto & effect : effects) {
    const auto * boxed = std::get_if<Box<ConditionalEffect>>(&effect);
    if (boxed == nullptr) {
      continue;
    }
    const ConditionalEffect & c = **boxed;
    const std::vector<AttributePath> targets = condition_targets(c.condition);
    if (enclosing != nullptr) {
      for (const auto & t : targets) {
        if (!std::binary_search(enclosing->begin(), enclosing->end(), t)) {
          return TransitionError{
            ErrorKind::Validation,
            fmt::format(
              "nested conditional reads '{}' which its enclosing conditional does not read",
              t.str())};
        }
      }
    }
    if (auto err = check_nested(c.then_effects, &targets)) {
      return err;
    }
    if (c.else_effects) {
      if (auto err = check_nested(*c.else_effects, &targets)) {
        return err;
      }
    }
  }
  return std::nullopt;
}

}  // namespace

std::optional<TransitionError> check_flat_structure(gsl::span<const Effect> effects)
{
  return check_nested(effects, nullptr);
}

EffectApplier::EffectApplier(const ObjectType & type, const ConditionEvaluator & evaluator)
: type_(type), evaluator_(evaluator), generator_(evaluator)
{
}

std::vector<EffectBranch> EffectApplier::apply(
  gsl::span<const Effect> effects, EffectBranch start) const
{
  std::vector<EffectBranch> active;
  active.push_back(std::move(start));
  for (const auto & effect : effects) {
    std::vector<EffectBranch> next;
    for (auto & branch : active) {
      if (branch.error) {
        next.push_back(std::move(branch));
        continue;
      }
      apply_effect(effect, std::move(branch), next);
    }
    active = std::move(next);
  }
  return active;
}

void EffectApplier::apply_effect(
  const Effect & effect, EffectBranch branch, std::vector<EffectBranch> & out) const
{
  std::visit(
    [&](const auto & e) {
      using T = std::decay_t<decltype(e)>;
      if constexpr (std::is_same_v<T, SetAttributeEffect>) {
        apply_set(e, branch);
        out.push_back(std::move(branch));
      } else if constexpr (std::is_same_v<T, SetTrendEffect>) {
        apply_trend(e, branch);
        out.push_back(std::move(branch));
      } else if constexpr (std::is_same_v<T, Box<ConditionalEffect>>) {
        apply_conditional(*e, std::move(branch), out, std::nullopt, false);
      } else {
        static_assert(always_false_v<T>, "unhandled effect kind");
      }
    },
    effect);
}

// `pending` carries the fail-side decision of an enclosing arm while an
// elif chain is walked; it is recorded only if no later arm branches.
// `in_chain` is set for every arm after the first, decided or not.
void EffectApplier::apply_conditional(
  const ConditionalEffect & conditional, EffectBranch branch, std::vector<EffectBranch> & out,
  std::optional<BranchCondition> pending, bool in_chain) const
{
  Split split = generator_.split(conditional.condition, branch.state);
  if (split.error) {
    branch.error = std::move(split.error);
    out.push_back(std::move(branch));
    return;
  }

  const auto success_compound = BranchGenerator::compound_type_of(conditional.condition);
  const ConditionalEffect * elif = conditional.elif();

  if (split.truth != Truth::Unknown) {
    if (split.truth == Truth::True) {
      if (pending) {
        pending->branch_type = BranchType::Elif;
        branch.decisions.push_back(std::move(*pending));
      }
      for (auto & b : apply(conditional.then_effects, std::move(branch))) {
        out.push_back(std::move(b));
      }
      return;
    }
    if (elif != nullptr) {
      apply_conditional(*elif, std::move(branch), out, std::move(pending), true);
      return;
    }
    if (pending) {
      pending->branch_type = BranchType::Else;
      branch.decisions.push_back(std::move(*pending));
    }
    apply_else(conditional, std::move(branch), out);
    return;
  }

  for (const auto & assumption : split.success) {
    EffectBranch arm = branch;
    arm.decisions.push_back(BranchGenerator::describe_branch(
      assumption, arm.state, ConditionSource::Postcondition,
      in_chain ? BranchType::Elif : BranchType::If, success_compound));
    arm.state = BranchGenerator::narrow(arm.state, assumption, arm.changes);
    for (auto & b : apply(conditional.then_effects, std::move(arm))) {
      out.push_back(std::move(b));
    }
  }

  for (const auto & assumption : split.fail) {
    EffectBranch arm = branch;
    BranchCondition decision = BranchGenerator::describe_branch(
      assumption, arm.state, ConditionSource::Postcondition, BranchType::Else,
      BranchGenerator::flip(success_compound));
    arm.state = BranchGenerator::narrow(arm.state, assumption, arm.changes);
    if (elif != nullptr) {
      apply_conditional(*elif, std::move(arm), out, std::move(decision), true);
      continue;
    }
    arm.decisions.push_back(std::move(decision));
    apply_else(conditional, std::move(arm), out);
  }
}

void EffectApplier::apply_else(
  const ConditionalEffect & conditional, EffectBranch branch, std::vector<EffectBranch> & out) const
{
  if (!conditional.else_effects) {
    branch.error = TransitionError{
      ErrorKind::RequiredPostcondition,
      fmt::format("required postcondition '{}' does not hold", describe(conditional.condition))};
    out.push_back(std::move(branch));
    return;
  }
  for (auto & b : apply(*conditional.else_effects, std::move(branch))) {
    out.push_back(std::move(b));
  }
}

const AttributeSpec * EffectApplier::writable(const AttributePath & path, EffectBranch & branch) const
{
  const AttributeSpec * spec = type_.find_attribute(path);
  if (spec == nullptr || !branch.state.contains(path)) {
    branch.error = TransitionError{
      ErrorKind::Domain,
      fmt::format("attribute '{}' does not exist on '{}'", path.str(), type_.name())};
    return nullptr;
  }
  if (!spec->is_mutable) {
    branch.error = TransitionError{
      ErrorKind::ImmutableWrite, fmt::format("attribute '{}' is immutable", path.str())};
    return nullptr;
  }
  return spec;
}

void EffectApplier::apply_set(const SetAttributeEffect & effect, EffectBranch & branch) const
{
  const AttributeSpec * spec = writable(effect.target, branch);
  if (spec == nullptr) {
    return;
  }

  std::string level;
  if (const auto * ref = std::get_if<ParameterRef>(&effect.value)) {
    const auto it = evaluator_.parameters().find(ref->name);
    if (it == evaluator_.parameters().end()) {
      branch.error = TransitionError{
        ErrorKind::Validation,
        fmt::format("parameter '{}' written to '{}' was not supplied", ref->name,
                    effect.target.str())};
      return;
    }
    level = it->second;
  } else {
    level = std::get<std::string>(effect.value);
  }

  const AttributeValue & current = *branch.state.find(effect.target);
  const auto idx = current.space->index_of(level);
  if (!idx) {
    branch.error = TransitionError{
      ErrorKind::Domain,
      fmt::format("'{}' is not a level of '{}' (space '{}')", level, effect.target.str(),
                  current.space->id())};
    return;
  }

  const AttributeValue updated = current.with_levels(LevelSet::single(*idx));
  record_change(branch.changes, Change{effect.target, ChangeKind::Value, current, updated});
  branch.state = branch.state.with(effect.target, updated);
}

void EffectApplier::apply_trend(const SetTrendEffect & effect, EffectBranch & branch) const
{
  if (writable(effect.target, branch) == nullptr) {
    return;
  }
  const AttributeValue & current = *branch.state.find(effect.target);
  const AttributeValue updated = current.with_trend(effect.direction);
  record_change(branch.changes, Change{effect.target, ChangeKind::Trend, current, updated});
  branch.state = branch.state.with(effect.target, updated);
}

}  // namespace qualsim
