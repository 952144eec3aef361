// qualsim/model/condition.hpp - Boolean condition trees over attributes
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "qualsim/basic/box.hpp"
#include "qualsim/model/attribute_path.hpp"
#include "qualsim/model/qualitative_space.hpp"

namespace qualsim
{

// ============================================================================
// Leaves
// ============================================================================

/// Value taken from the action's parameter map at evaluation time.
struct ParameterRef
{
  std::string name;
};

/// Literal level names, or a parameter whose value names a level.
using Operand = std::variant<std::vector<std::string>, ParameterRef>;

/**
 * `target <op> operand`. Ordered operators take exactly one level.
 */
struct AttributeCheck
{
  AttributePath target;
  CompareOp op = CompareOp::Equals;
  Operand operand;
};

/**
 * Condition on a supplied parameter rather than on the world.
 *
 * With `expected_value` set the parameter must equal it; otherwise it must
 * be present and, when `valid_values` is non-empty, one of them.
 */
struct ParameterCheck
{
  std::string parameter;
  std::vector<std::string> valid_values;
  std::optional<std::string> expected_value;
};

// ============================================================================
// Compound conditions
// ============================================================================

struct AndCondition;
struct OrCondition;
struct NotCondition;
struct ImplicationCondition;

using Condition = std::variant<
  AttributeCheck, ParameterCheck, Box<AndCondition>, Box<OrCondition>, Box<NotCondition>,
  Box<ImplicationCondition>>;

struct AndCondition
{
  std::vector<Condition> items;
};

struct OrCondition
{
  std::vector<Condition> items;
};

struct NotCondition
{
  Condition item;
};

/// `if antecedent then consequent`, i.e. `not antecedent or consequent`.
struct ImplicationCondition
{
  Condition antecedent;
  Condition consequent;
};

// ============================================================================
// Construction helpers
// ============================================================================

[[nodiscard]] Condition check(
  std::string_view path, CompareOp op, std::vector<std::string> levels);
[[nodiscard]] Condition check_param(std::string_view path, CompareOp op, std::string parameter);
[[nodiscard]] Condition all_of(std::vector<Condition> items);
[[nodiscard]] Condition any_of(std::vector<Condition> items);
[[nodiscard]] Condition negate(Condition item);
[[nodiscard]] Condition implies(Condition antecedent, Condition consequent);

// ============================================================================
// Queries
// ============================================================================

/// Human readable form, e.g. "(battery.level != empty and switch.position == off)".
[[nodiscard]] std::string describe(const Condition & condition);

/// Every attribute the condition reads, sorted and unique.
[[nodiscard]] std::vector<AttributePath> condition_targets(const Condition & condition);

/// Symbolic spelling used in describe(), e.g. "!=" for NotEquals.
[[nodiscard]] std::string_view symbol(CompareOp op) noexcept;

}  // namespace qualsim
