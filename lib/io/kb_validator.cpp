// qualsim/io/kb_validator.cpp
#include "qualsim/io/kb_validator.hpp"

#include <fmt/core.h>

#include <type_traits>
#include <utility>
#include <vector>

#include "qualsim/engine/effect_applier.hpp"

namespace qualsim
{

namespace
{

template <typename>
inline constexpr bool always_false_v = false;

/**
 * Checks one definition (action, behaviour or rule) against the object
 * types it may run on.
 */
class DefinitionChecker
{
public:
  DefinitionChecker(
    DiagnosticBag & diags, KbLocation where, std::string context,
    std::vector<const ObjectType *> types, const Action * parameters_from)
  : diags_(diags),
    where_(std::move(where)),
    context_(std::move(context)),
    types_(std::move(types)),
    action_(parameters_from)
  {
  }

  void conditions(const std::vector<Condition> & items)
  {
    for (const auto & c : items) {
      condition(c);
    }
  }

  void condition(const Condition & c)
  {
    std::visit(
      [this](const auto & node) {
        using T = std::decay_t<decltype(node)>;
        if constexpr (std::is_same_v<T, AttributeCheck>) {
          check(node);
        } else if constexpr (std::is_same_v<T, ParameterCheck>) {
          parameter(node.parameter);
        } else if constexpr (std::is_same_v<T, Box<AndCondition>>) {
          conditions(node->items);
        } else if constexpr (std::is_same_v<T, Box<OrCondition>>) {
          conditions(node->items);
        } else if constexpr (std::is_same_v<T, Box<NotCondition>>) {
          condition(node->item);
        } else if constexpr (std::is_same_v<T, Box<ImplicationCondition>>) {
          condition(node->antecedent);
          condition(node->consequent);
        } else {
          static_assert(always_false_v<T>, "unhandled condition kind");
        }
      },
      c);
  }

  void effects(const std::vector<Effect> & items)
  {
    if (auto err = check_flat_structure(items)) {
      diags_.report_error(where_, fmt::format("{}: {}", context_, err->message))
        .with_code("K007")
        .with_help("split the nested decision into its own conditional at the top level");
    }
    walk_effects(items);
  }

private:
  void walk_effects(const std::vector<Effect> & items)
  {
    for (const auto & e : items) {
      std::visit(
        [this](const auto & node) {
          using T = std::decay_t<decltype(node)>;
          if constexpr (std::is_same_v<T, SetAttributeEffect>) {
            const AttributeSpec * spec = attribute(node.target, true);
            if (const auto * ref = std::get_if<ParameterRef>(&node.value)) {
              parameter(ref->name);
            } else if (spec != nullptr) {
              level(*spec, node.target, std::get<std::string>(node.value));
            }
          } else if constexpr (std::is_same_v<T, SetTrendEffect>) {
            attribute(node.target, true);
          } else if constexpr (std::is_same_v<T, Box<ConditionalEffect>>) {
            condition(node->condition);
            walk_effects(node->then_effects);
            if (node->else_effects) {
              walk_effects(*node->else_effects);
            }
          } else {
            static_assert(always_false_v<T>, "unhandled effect kind");
          }
        },
        e);
    }
  }

  void check(const AttributeCheck & c)
  {
    const AttributeSpec * spec = attribute(c.target, false);
    if (const auto * ref = std::get_if<ParameterRef>(&c.operand)) {
      parameter(ref->name);
      return;
    }
    const auto & names = std::get<std::vector<std::string>>(c.operand);
    if (is_ordered(c.op) && names.size() != 1) {
      diags_
        .report_error(
          where_, fmt::format(
                    "{}: operator '{}' on '{}' needs exactly one level", context_,
                    to_string(c.op), c.target.str()))
        .with_code("K006");
    }
    if (spec != nullptr) {
      for (const auto & n : names) {
        level(*spec, c.target, n);
      }
    }
  }

  /// First declaration of @p path among the candidate types.
  const AttributeSpec * attribute(const AttributePath & path, bool written)
  {
    const AttributeSpec * found = nullptr;
    for (const ObjectType * t : types_) {
      if ((found = t->find_attribute(path)) != nullptr) {
        break;
      }
    }
    if (found == nullptr) {
      auto b = diags_.report_error(
        where_, fmt::format("{}: unknown attribute '{}'", context_, path.str()));
      b.with_code("K004");
      if (types_.size() == 1) {
        b.with_help(fmt::format("'{}' declares no such attribute", types_.front()->name()));
      }
      return nullptr;
    }
    if (written && !found->is_mutable) {
      diags_
        .report_error(
          where_, fmt::format("{}: writes immutable attribute '{}'", context_, path.str()))
        .with_code("K008");
    }
    return found;
  }

  void level(const AttributeSpec & spec, const AttributePath & path, const std::string & name)
  {
    if (spec.space == nullptr || spec.space->has_level(name)) {
      return;
    }
    std::string allowed;
    for (const auto & l : spec.space->levels()) {
      allowed += allowed.empty() ? l : ", " + l;
    }
    diags_
      .report_error(
        where_, fmt::format(
                  "{}: '{}' is not a level of space '{}' (used by '{}')", context_, name,
                  spec.space->id(), path.str()))
      .with_code("K003")
      .with_help(fmt::format("valid levels are: {}", allowed));
  }

  void parameter(const std::string & name)
  {
    if (action_ != nullptr && action_->find_parameter(name) != nullptr) {
      return;
    }
    diags_
      .report_error(where_, fmt::format("{}: unknown parameter '{}'", context_, name))
      .with_code("K009");
  }

  DiagnosticBag & diags_;
  KbLocation where_;
  std::string context_;
  std::vector<const ObjectType *> types_;
  const Action * action_;
};

KbLocation origin_of(const KbOrigins * origins, const std::string & key)
{
  if (origins == nullptr) {
    return {};
  }
  const auto it = origins->find(key);
  return it == origins->end() ? KbLocation{} : it->second;
}

}  // namespace

void validate_knowledge_base(const KnowledgeBase & kb, DiagnosticBag & diags, const KbOrigins * origins)
{
  std::vector<const ObjectType *> all_types;
  for (const auto & [name, type] : kb.object_types()) {
    all_types.push_back(&type);
  }

  for (const auto & action : kb.actions()) {
    const std::string owner = action.is_generic() ? "generic" : action.object_type;
    const KbLocation where = origin_of(origins, fmt::format("action:{}:{}", owner, action.name));

    std::vector<const ObjectType *> types;
    if (action.is_generic()) {
      types = all_types;
    } else if (const ObjectType * t = kb.find_object_type(action.object_type)) {
      types.push_back(t);
    } else {
      diags
        .report_error(
          where, fmt::format(
                   "action '{}' refers to unknown object type '{}'", action.name,
                   action.object_type))
        .with_code("K004");
      continue;
    }

    DefinitionChecker checker(
      diags, where, fmt::format("action '{}'", action.name), std::move(types), &action);
    checker.conditions(action.preconditions);
    checker.effects(action.effects);
  }

  for (const auto & [type_name, type] : kb.object_types()) {
    for (const auto & [action_name, behavior] : type.behaviors()) {
      const Action * base = kb.find_action(type_name, action_name);
      DefinitionChecker checker(
        diags, origin_of(origins, fmt::format("behavior:{}:{}", type_name, action_name)),
        fmt::format("behavior '{}' of '{}'", action_name, type_name), {&type}, base);
      checker.conditions(behavior.preconditions);
      checker.effects(behavior.effects);
    }

    for (size_t i = 0; i < type.constraints().size(); ++i) {
      const DependencyRule & rule = type.constraints()[i];
      DefinitionChecker checker(
        diags, origin_of(origins, fmt::format("constraint:{}:{}", type_name, i)),
        fmt::format("constraint {} of '{}'", i, type_name), {&type}, nullptr);
      checker.condition(rule.condition);
      checker.condition(rule.requirement);
    }
  }
}

}  // namespace qualsim
