// qualsim/model/object_type.cpp
#include "qualsim/model/object_type.hpp"

#include <fmt/core.h>

#include <utility>

namespace qualsim
{

LevelSet AttributeSpec::default_levels() const
{
  if (space == nullptr || space->size() == 0) {
    return {};
  }
  if (!default_value) {
    return LevelSet::single(0);
  }
  if (*default_value == k_unknown_default) {
    return space->all();
  }
  const auto idx = space->index_of(*default_value);
  return idx ? LevelSet::single(*idx) : LevelSet::single(0);
}

std::string DependencyRule::describe() const
{
  const std::string text =
    fmt::format("if {} then {}", qualsim::describe(condition), qualsim::describe(requirement));
  return name.empty() ? text : fmt::format("{}: {}", name, text);
}

void ObjectType::add_part(PartSpec part)
{
  std::string key = part.name;
  parts_[std::move(key)] = std::move(part);
}

void ObjectType::add_global_attribute(AttributeSpec attribute)
{
  std::string key = attribute.name;
  globals_[std::move(key)] = std::move(attribute);
}

void ObjectType::add_behavior(std::string action_name, Behavior behavior)
{
  behaviors_[std::move(action_name)] = std::move(behavior);
}

const AttributeSpec * ObjectType::find_attribute(const AttributePath & path) const
{
  if (path.is_global()) {
    const auto it = globals_.find(path.attribute());
    return it == globals_.end() ? nullptr : &it->second;
  }
  const auto part = parts_.find(path.part());
  if (part == parts_.end()) {
    return nullptr;
  }
  const auto it = part->second.attributes.find(path.attribute());
  return it == part->second.attributes.end() ? nullptr : &it->second;
}

const Behavior * ObjectType::find_behavior(std::string_view action_name) const
{
  const auto it = behaviors_.find(std::string(action_name));
  return it == behaviors_.end() ? nullptr : &it->second;
}

std::vector<AttributePath> ObjectType::attribute_paths() const
{
  std::vector<AttributePath> out;
  for (const auto & [part_name, part] : parts_) {
    for (const auto & [attr_name, spec] : part.attributes) {
      out.emplace_back(part_name, attr_name);
    }
  }
  for (const auto & [attr_name, spec] : globals_) {
    out.emplace_back("", attr_name);
  }
  return out;
}

WorldSnapshot ObjectType::default_snapshot() const
{
  WorldSnapshot::ValueMap values;
  for (const auto & path : attribute_paths()) {
    const AttributeSpec * spec = find_attribute(path);
    values.emplace(path, AttributeValue{spec->space, spec->default_levels(), Trend::None});
  }
  return WorldSnapshot{std::move(values)};
}

}  // namespace qualsim
