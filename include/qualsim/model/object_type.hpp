// qualsim/model/object_type.hpp - Object type templates
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "qualsim/model/action.hpp"
#include "qualsim/model/attribute_path.hpp"
#include "qualsim/model/condition.hpp"
#include "qualsim/model/qualitative_space.hpp"
#include "qualsim/model/snapshot.hpp"

namespace qualsim
{

/// Default keyword meaning "any level of the space".
inline constexpr std::string_view k_unknown_default = "unknown";

struct AttributeSpec
{
  std::string name;
  const QualitativeSpace * space = nullptr;
  bool is_mutable = true;
  /// Level name, "unknown", or std::nullopt for the space's first level.
  std::optional<std::string> default_value;

  /// Initial value set for this attribute.
  [[nodiscard]] LevelSet default_levels() const;
};

struct PartSpec
{
  std::string name;
  std::map<std::string, AttributeSpec> attributes;
};

/**
 * `condition` implies `requirement`. Checked on every successor snapshot.
 */
struct DependencyRule
{
  std::string name;
  Condition condition;
  Condition requirement;

  [[nodiscard]] std::string describe() const;
};

/**
 * Template for simulated objects: parts with attributes, global
 * attributes, dependency rules and per-action behaviours.
 */
class ObjectType
{
public:
  ObjectType() = default;
  explicit ObjectType(std::string name) : name_(std::move(name)) {}

  [[nodiscard]] const std::string & name() const noexcept { return name_; }

  void add_part(PartSpec part);
  void add_global_attribute(AttributeSpec attribute);
  void add_constraint(DependencyRule rule) { constraints_.push_back(std::move(rule)); }
  void add_behavior(std::string action_name, Behavior behavior);

  [[nodiscard]] const std::map<std::string, PartSpec> & parts() const noexcept { return parts_; }
  [[nodiscard]] const std::map<std::string, AttributeSpec> & global_attributes() const noexcept
  {
    return globals_;
  }
  [[nodiscard]] const std::vector<DependencyRule> & constraints() const noexcept
  {
    return constraints_;
  }
  [[nodiscard]] const std::map<std::string, Behavior> & behaviors() const noexcept
  {
    return behaviors_;
  }

  [[nodiscard]] const AttributeSpec * find_attribute(const AttributePath & path) const;
  [[nodiscard]] const Behavior * find_behavior(std::string_view action_name) const;

  /// All attribute paths in snapshot order.
  [[nodiscard]] std::vector<AttributePath> attribute_paths() const;

  /// Snapshot holding every attribute at its default, trend none.
  [[nodiscard]] WorldSnapshot default_snapshot() const;

private:
  std::string name_;
  std::map<std::string, PartSpec> parts_;
  std::map<std::string, AttributeSpec> globals_;
  std::vector<DependencyRule> constraints_;
  std::map<std::string, Behavior> behaviors_;
};

}  // namespace qualsim
