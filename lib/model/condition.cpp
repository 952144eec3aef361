// qualsim/model/condition.cpp
#include "qualsim/model/condition.hpp"

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

std::string describe_operand(const Operand & operand)
{
  if (const auto * ref = std::get_if<ParameterRef>(&operand)) {
    return "$" + ref->name;
  }
  const auto & levels = std::get<std::vector<std::string>>(operand);
  if (levels.size() == 1) {
    return levels.front();
  }
  std::string out = "[";
  for (size_t i = 0; i < levels.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += levels[i];
  }
  return out + "]";
}

std::string join_items(const std::vector<Condition> & items, std::string_view sep)
{
  std::string out = "(";
  for (size_t i = 0; i < items.size(); ++i) {
    if (i > 0) {
      out += fmt::format(" {} ", sep);
    }
    out += describe(items[i]);
  }
  return out + ")";
}

void collect_targets(const Condition & condition, std::vector<AttributePath> & out)
{
  std::visit(
    [&out](const auto & c) {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, AttributeCheck>) {
        out.push_back(c.target);
      } else if constexpr (std::is_same_v<T, ParameterCheck>) {
        // reads no attribute
      } else if constexpr (std::is_same_v<T, Box<AndCondition>>) {
        for (const auto & item : c->items) {
          collect_targets(item, out);
        }
      } else if constexpr (std::is_same_v<T, Box<OrCondition>>) {
        for (const auto & item : c->items) {
          collect_targets(item, out);
        }
      } else if constexpr (std::is_same_v<T, Box<NotCondition>>) {
        collect_targets(c->item, out);
      } else if constexpr (std::is_same_v<T, Box<ImplicationCondition>>) {
        collect_targets(c->antecedent, out);
        collect_targets(c->consequent, out);
      } else {
        static_assert(always_false_v<T>, "unhandled condition kind");
      }
    },
    condition);
}

}  // namespace

Condition check(std::string_view path, CompareOp op, std::vector<std::string> levels)
{
  return AttributeCheck{
    AttributePath::parse(path).value_or(AttributePath{}), op, Operand{std::move(levels)}};
}

Condition check_param(std::string_view path, CompareOp op, std::string parameter)
{
  return AttributeCheck{
    AttributePath::parse(path).value_or(AttributePath{}), op,
    Operand{ParameterRef{std::move(parameter)}}};
}

Condition all_of(std::vector<Condition> items)
{
  return Box<AndCondition>(AndCondition{std::move(items)});
}

Condition any_of(std::vector<Condition> items)
{
  return Box<OrCondition>(OrCondition{std::move(items)});
}

Condition negate(Condition item) { return Box<NotCondition>(NotCondition{std::move(item)}); }

Condition implies(Condition antecedent, Condition consequent)
{
  return Box<ImplicationCondition>(
    ImplicationCondition{std::move(antecedent), std::move(consequent)});
}

std::string_view symbol(CompareOp op) noexcept
{
  switch (op) {
    case CompareOp::Equals:
      return "==";
    case CompareOp::NotEquals:
      return "!=";
    case CompareOp::Lt:
      return "<";
    case CompareOp::Lte:
      return "<=";
    case CompareOp::Gt:
      return ">";
    case CompareOp::Gte:
      return ">=";
    case CompareOp::In:
      return "in";
    case CompareOp::NotIn:
      return "not in";
  }
  return "==";
}

std::string describe(const Condition & condition)
{
  return std::visit(
    [](const auto & c) -> std::string {
      using T = std::decay_t<decltype(c)>;
      if constexpr (std::is_same_v<T, AttributeCheck>) {
        return fmt::format("{} {} {}", c.target.str(), symbol(c.op), describe_operand(c.operand));
      } else if constexpr (std::is_same_v<T, ParameterCheck>) {
        if (c.expected_value) {
          return fmt::format("${} == {}", c.parameter, *c.expected_value);
        }
        return fmt::format("${} is valid", c.parameter);
      } else if constexpr (std::is_same_v<T, Box<AndCondition>>) {
        return join_items(c->items, "and");
      } else if constexpr (std::is_same_v<T, Box<OrCondition>>) {
        return join_items(c->items, "or");
      } else if constexpr (std::is_same_v<T, Box<NotCondition>>) {
        return "not " + describe(c->item);
      } else if constexpr (std::is_same_v<T, Box<ImplicationCondition>>) {
        return fmt::format("(if {} then {})", describe(c->antecedent), describe(c->consequent));
      } else {
        static_assert(always_false_v<T>, "unhandled condition kind");
      }
    },
    condition);
}

std::vector<AttributePath> condition_targets(const Condition & condition)
{
  std::vector<AttributePath> out;
  collect_targets(condition, out);
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

}  // namespace qualsim
