// qualsim/engine/condition_evaluator.cpp
#include "qualsim/engine/condition_evaluator.hpp"

#include <fmt/core.h>

#include <type_traits>
#include <utility>

namespace qualsim
{

namespace
{

template <typename>
inline constexpr bool always_false_v = false;

Truth invert(Truth t) noexcept
{
  switch (t) {
    case Truth::True:
      return Truth::False;
    case Truth::False:
      return Truth::True;
    case Truth::Unknown:
      break;
  }
  return Truth::Unknown;
}

void append_witnesses(Evaluation & into, const Evaluation & from)
{
  into.witnesses.insert(into.witnesses.end(), from.witnesses.begin(), from.witnesses.end());
}

}  // namespace

std::string_view to_string(Truth truth) noexcept
{
  switch (truth) {
    case Truth::False:
      return "false";
    case Truth::True:
      return "true";
    case Truth::Unknown:
      return "unknown";
  }
  return "unknown";
}

// ============================================================================
// Public API
// ============================================================================

Evaluation ConditionEvaluator::evaluate(
  const Condition & condition, const WorldSnapshot & snapshot) const
{
  return std::visit(
    [this, &snapshot](const auto & c) -> Evaluation {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, AttributeCheck>) {
        return evaluate_check(c, snapshot);
      } else if constexpr (std::is_same_v<T, ParameterCheck>) {
        return evaluate_parameter(c);
      } else if constexpr (std::is_same_v<T, Box<AndCondition>>) {
        return evaluate_all(c->items, snapshot);
      } else if constexpr (std::is_same_v<T, Box<OrCondition>>) {
        return evaluate_any(c->items, snapshot);
      } else if constexpr (std::is_same_v<T, Box<NotCondition>>) {
        Evaluation inner = evaluate(c->item, snapshot);
        if (inner.ok()) {
          inner.truth = invert(inner.truth);
        }
        return inner;
      } else if constexpr (std::is_same_v<T, Box<ImplicationCondition>>) {
        // not antecedent or consequent
        Evaluation a = evaluate(c->antecedent, snapshot);
        if (!a.ok()) {
          return a;
        }
        if (a.truth == Truth::False) {
          return Evaluation::of(Truth::True);
        }
        Evaluation b = evaluate(c->consequent, snapshot);
        if (!b.ok() || b.truth == Truth::True) {
          return b.ok() ? Evaluation::of(Truth::True) : b;
        }
        if (a.truth == Truth::True && b.truth == Truth::False) {
          return Evaluation::of(Truth::False);
        }
        Evaluation out = Evaluation::of(Truth::Unknown);
        append_witnesses(out, a);
        append_witnesses(out, b);
        return out;
      } else {
        static_assert(always_false_v<T>, "unhandled condition kind");
      }
    },
    condition);
}

ResolvedCheck ConditionEvaluator::resolve(
  const AttributeCheck & check, const WorldSnapshot & snapshot) const
{
  ResolvedCheck out;
  out.current = snapshot.find(check.target);
  if (out.current == nullptr || out.current->space == nullptr) {
    out.error = TransitionError{
      ErrorKind::Domain, fmt::format("attribute '{}' does not exist", check.target.str())};
    return out;
  }
  const QualitativeSpace & space = *out.current->space;

  std::vector<std::string> names;
  if (const auto * ref = std::get_if<ParameterRef>(&check.operand)) {
    const auto it = parameters_.find(ref->name);
    if (it == parameters_.end()) {
      out.error = TransitionError{
        ErrorKind::Validation,
        fmt::format("parameter '{}' referenced by '{}' was not supplied", ref->name,
                    check.target.str())};
      return out;
    }
    names.push_back(it->second);
  } else {
    names = std::get<std::vector<std::string>>(check.operand);
  }

  const auto operand = space.resolve(names);
  if (!operand) {
    out.error = TransitionError{
      ErrorKind::UnknownLevel,
      fmt::format("value for '{}' is not a level of space '{}'", check.target.str(), space.id())};
    return out;
  }
  if (is_ordered(check.op) && operand->size() != 1) {
    out.error = TransitionError{
      ErrorKind::Validation,
      fmt::format("operator '{}' on '{}' needs exactly one level", to_string(check.op),
                  check.target.str())};
    return out;
  }

  out.satisfying = space.expand(check.op, *operand);
  return out;
}

// ============================================================================
// Private helpers
// ============================================================================

Evaluation ConditionEvaluator::evaluate_check(
  const AttributeCheck & check, const WorldSnapshot & snapshot) const
{
  ResolvedCheck r = resolve(check, snapshot);
  if (r.error) {
    return Evaluation::fail(std::move(*r.error));
  }
  const LevelSet current = r.current->levels;
  if (current.is_subset_of(r.satisfying)) {
    return Evaluation::of(Truth::True);
  }
  if (!current.intersects(r.satisfying)) {
    return Evaluation::of(Truth::False);
  }
  Evaluation out = Evaluation::of(Truth::Unknown);
  out.witnesses.push_back(check.target);
  return out;
}

Evaluation ConditionEvaluator::evaluate_parameter(const ParameterCheck & check) const
{
  const auto it = parameters_.find(check.parameter);
  if (it == parameters_.end()) {
    return Evaluation::of(Truth::False);
  }
  if (check.expected_value) {
    return Evaluation::of(it->second == *check.expected_value ? Truth::True : Truth::False);
  }
  if (check.valid_values.empty()) {
    return Evaluation::of(Truth::True);
  }
  for (const auto & v : check.valid_values) {
    if (v == it->second) {
      return Evaluation::of(Truth::True);
    }
  }
  return Evaluation::of(Truth::False);
}

Evaluation ConditionEvaluator::evaluate_all(
  const std::vector<Condition> & items, const WorldSnapshot & snapshot) const
{
  Evaluation out = Evaluation::of(Truth::True);
  for (const auto & item : items) {
    Evaluation e = evaluate(item, snapshot);
    if (!e.ok() || e.truth == Truth::False) {
      return e;
    }
    if (e.truth == Truth::Unknown) {
      out.truth = Truth::Unknown;
      append_witnesses(out, e);
    }
  }
  return out;
}

Evaluation ConditionEvaluator::evaluate_any(
  const std::vector<Condition> & items, const WorldSnapshot & snapshot) const
{
  Evaluation out = Evaluation::of(Truth::False);
  for (const auto & item : items) {
    Evaluation e = evaluate(item, snapshot);
    if (!e.ok() || e.truth == Truth::True) {
      return e;
    }
    if (e.truth == Truth::Unknown) {
      out.truth = Truth::Unknown;
      append_witnesses(out, e);
    }
  }
  return out;
}

}  // namespace qualsim
