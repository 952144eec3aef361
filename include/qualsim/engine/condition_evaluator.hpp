// qualsim/engine/condition_evaluator.hpp - Three-valued condition evaluation
#pragma once

#include <cstdint>
#include <optional>
#include <string_view>
#include <vector>

#include "qualsim/engine/transition.hpp"
#include "qualsim/model/action.hpp"
#include "qualsim/model/condition.hpp"
#include "qualsim/model/snapshot.hpp"

namespace qualsim
{

enum class Truth : uint8_t {
  False,
  True,
  Unknown,
};

[[nodiscard]] std::string_view to_string(Truth truth) noexcept;

/**
 * Outcome of evaluating a condition against a snapshot.
 *
 * `witnesses` lists the attributes whose uncertainty made the result
 * Unknown. When `error` is set the truth value is meaningless.
 */
struct Evaluation
{
  Truth truth = Truth::False;
  std::vector<AttributePath> witnesses;
  std::optional<TransitionError> error;

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }

  [[nodiscard]] static Evaluation of(Truth t) { return Evaluation{t, {}, std::nullopt}; }
  [[nodiscard]] static Evaluation fail(TransitionError e)
  {
    return Evaluation{Truth::False, {}, std::move(e)};
  }
};

/**
 * An AttributeCheck resolved against one snapshot: the attribute's current
 * value and the levels for which the check holds.
 */
struct ResolvedCheck
{
  const AttributeValue * current = nullptr;
  LevelSet satisfying;
  std::optional<TransitionError> error;
};

/**
 * Evaluates conditions over possibly uncertain attribute values.
 *
 * For a check with current set C and satisfying set S the result is True
 * when C is a subset of S, False when they are disjoint, Unknown otherwise.
 * Compound conditions combine their items with Kleene logic.
 *
 * Levels are read as stored; trended values must be materialised by the
 * caller before evaluation.
 */
class ConditionEvaluator
{
public:
  /// @param parameters Must outlive the evaluator.
  explicit ConditionEvaluator(const ParameterMap & parameters) : parameters_(parameters) {}

  [[nodiscard]] Evaluation evaluate(const Condition & condition, const WorldSnapshot & snapshot) const;

  [[nodiscard]] ResolvedCheck resolve(const AttributeCheck & check, const WorldSnapshot & snapshot) const;

  [[nodiscard]] const ParameterMap & parameters() const noexcept { return parameters_; }

private:
  [[nodiscard]] Evaluation evaluate_check(const AttributeCheck & check, const WorldSnapshot & snapshot) const;
  [[nodiscard]] Evaluation evaluate_parameter(const ParameterCheck & check) const;
  [[nodiscard]] Evaluation evaluate_all(
    const std::vector<Condition> & items, const WorldSnapshot & snapshot) const;
  [[nodiscard]] Evaluation evaluate_any(
    const std::vector<Condition> & items, const WorldSnapshot & snapshot) const;

  const ParameterMap & parameters_;
};

}  // namespace qualsim
