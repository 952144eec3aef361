// qualsim/model/knowledge_base.cpp
#include "qualsim/model/knowledge_base.hpp"

#include <algorithm>

namespace qualsim
{

const QualitativeSpace * KnowledgeBase::find_space(std::string_view id) const
{
  const auto it = spaces_.find(std::string(id));
  return it == spaces_.end() ? nullptr : it->second.get();
}

const ObjectType * KnowledgeBase::find_object_type(std::string_view name) const
{
  const auto it = object_types_.find(std::string(name));
  return it == object_types_.end() ? nullptr : &it->second;
}

const Action * KnowledgeBase::find_action(std::string_view object_type, std::string_view name) const
{
  const Action * generic = nullptr;
  for (const auto & action : actions_) {
    if (action.name != name) {
      continue;
    }
    if (action.object_type == object_type) {
      return &action;
    }
    if (action.is_generic() && generic == nullptr) {
      generic = &action;
    }
  }
  return generic;
}

std::optional<Action> KnowledgeBase::resolve_action(
  std::string_view object_type, std::string_view name) const
{
  const ObjectType * type = find_object_type(object_type);
  const Behavior * behavior = type != nullptr ? type->find_behavior(name) : nullptr;
  const Action * base = find_action(object_type, name);

  if (base == nullptr && behavior == nullptr) {
    return std::nullopt;
  }

  Action out;
  if (base != nullptr) {
    out = *base;
  } else {
    out.name = std::string(name);
  }
  out.object_type = std::string(object_type);

  if (behavior != nullptr) {
    out.preconditions.insert(
      out.preconditions.end(), behavior->preconditions.begin(), behavior->preconditions.end());
    out.effects.insert(out.effects.end(), behavior->effects.begin(), behavior->effects.end());
  }
  return out;
}

std::vector<std::string> KnowledgeBase::action_names(std::string_view object_type) const
{
  std::vector<std::string> out;
  for (const auto & action : actions_) {
    if (action.is_generic() || action.object_type == object_type) {
      out.push_back(action.name);
    }
  }
  if (const ObjectType * type = find_object_type(object_type)) {
    for (const auto & [name, behavior] : type->behaviors()) {
      out.push_back(name);
    }
  }
  std::sort(out.begin(), out.end());
  out.erase(std::unique(out.begin(), out.end()), out.end());
  return out;
}

// ============================================================================
// KnowledgeBaseBuilder
// ============================================================================

const QualitativeSpace * KnowledgeBaseBuilder::add_space(QualitativeSpace space)
{
  std::string id = space.id();
  if (kb_.spaces_.count(id) != 0) {
    return nullptr;
  }
  auto stored = std::make_unique<QualitativeSpace>(std::move(space));
  const QualitativeSpace * ptr = stored.get();
  kb_.spaces_.emplace(std::move(id), std::move(stored));
  return ptr;
}

bool KnowledgeBaseBuilder::add_object_type(ObjectType type)
{
  std::string name = type.name();
  return kb_.object_types_.emplace(std::move(name), std::move(type)).second;
}

bool KnowledgeBaseBuilder::add_action(Action action)
{
  const bool duplicate =
    std::any_of(kb_.actions_.begin(), kb_.actions_.end(), [&action](const Action & a) {
      return a.name == action.name && a.object_type == action.object_type;
    });
  if (duplicate) {
    return false;
  }
  kb_.actions_.push_back(std::move(action));
  return true;
}

KnowledgeBase KnowledgeBaseBuilder::build() && { return std::move(kb_); }

}  // namespace qualsim
