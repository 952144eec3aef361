// qualsim/model/knowledge_base.hpp - Immutable registry of spaces, objects and actions
#pragma once

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qualsim/model/action.hpp"
#include "qualsim/model/object_type.hpp"
#include "qualsim/model/qualitative_space.hpp"

namespace qualsim
{

class KnowledgeBaseBuilder;

/**
 * Everything a simulation reads: qualitative spaces, object types and
 * actions. Built once through KnowledgeBaseBuilder and only read afterwards,
 * so it may be shared across worker threads.
 *
 * Spaces live behind stable pointers; AttributeValue and AttributeSpec keep
 * raw pointers into them for the lifetime of the knowledge base.
 */
class KnowledgeBase
{
public:
  KnowledgeBase() = default;

  KnowledgeBase(const KnowledgeBase &) = delete;
  KnowledgeBase & operator=(const KnowledgeBase &) = delete;
  KnowledgeBase(KnowledgeBase &&) = default;
  KnowledgeBase & operator=(KnowledgeBase &&) = default;

  [[nodiscard]] const QualitativeSpace * find_space(std::string_view id) const;
  [[nodiscard]] const ObjectType * find_object_type(std::string_view name) const;

  /// Object-specific action if one exists, otherwise the generic one.
  [[nodiscard]] const Action * find_action(
    std::string_view object_type, std::string_view name) const;

  /**
   * Effective action for @p object_type: the object-specific or generic
   * definition with the object's behaviour appended. A behaviour with no
   * action definition stands alone. std::nullopt if neither exists.
   */
  [[nodiscard]] std::optional<Action> resolve_action(
    std::string_view object_type, std::string_view name) const;

  [[nodiscard]] const std::map<std::string, std::unique_ptr<QualitativeSpace>> & spaces() const
  {
    return spaces_;
  }
  [[nodiscard]] const std::map<std::string, ObjectType> & object_types() const
  {
    return object_types_;
  }
  [[nodiscard]] const std::vector<Action> & actions() const { return actions_; }

  /// Names of actions usable on @p object_type, sorted.
  [[nodiscard]] std::vector<std::string> action_names(std::string_view object_type) const;

private:
  friend class KnowledgeBaseBuilder;

  std::map<std::string, std::unique_ptr<QualitativeSpace>> spaces_;
  std::map<std::string, ObjectType> object_types_;
  std::vector<Action> actions_;
};

/**
 * Collects definitions and hands over a finished KnowledgeBase.
 *
 * add_* return false on a duplicate key and leave the first definition in
 * place.
 */
class KnowledgeBaseBuilder
{
public:
  KnowledgeBaseBuilder() = default;

  /// @return The stored space (stable address), or nullptr on duplicate id.
  const QualitativeSpace * add_space(QualitativeSpace space);
  bool add_object_type(ObjectType type);
  bool add_action(Action action);

  [[nodiscard]] const QualitativeSpace * find_space(std::string_view id) const
  {
    return kb_.find_space(id);
  }
  [[nodiscard]] const ObjectType * find_object_type(std::string_view name) const
  {
    return kb_.find_object_type(name);
  }

  [[nodiscard]] KnowledgeBase build() &&;

private:
  KnowledgeBase kb_;
};

}  // namespace qualsim
