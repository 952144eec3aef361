// qualsim/model/snapshot.cpp
#include "qualsim/model/snapshot.hpp"

#include <fmt/core.h>

#include <utility>

namespace qualsim
{

std::string AttributeValue::describe() const
{
  std::string out = space != nullptr ? space->describe(levels) : "?";
  if (trend != Trend::None) {
    out += fmt::format(" ({})", to_string(trend));
  }
  return out;
}

WorldSnapshot::WorldSnapshot(ValueMap values, uint64_t sequence)
: values_(std::move(values)), sequence_(sequence)
{
}

const AttributeValue * WorldSnapshot::find(const AttributePath & path) const
{
  const auto it = values_.find(path);
  return it == values_.end() ? nullptr : &it->second;
}

WorldSnapshot WorldSnapshot::with(const AttributePath & path, AttributeValue value) const
{
  WorldSnapshot copy = *this;
  copy.values_[path] = value;
  return copy;
}

WorldSnapshot WorldSnapshot::with_levels(const AttributePath & path, LevelSet levels) const
{
  const AttributeValue * current = find(path);
  if (current == nullptr) {
    return *this;
  }
  return with(path, current->with_levels(levels));
}

WorldSnapshot WorldSnapshot::with_trend(const AttributePath & path, Trend trend) const
{
  const AttributeValue * current = find(path);
  if (current == nullptr) {
    return *this;
  }
  return with(path, current->with_trend(trend));
}

WorldSnapshot WorldSnapshot::with_sequence(uint64_t sequence) const
{
  WorldSnapshot copy = *this;
  copy.sequence_ = sequence;
  return copy;
}

WorldSnapshot WorldSnapshot::materialize_trends() const
{
  WorldSnapshot copy = *this;
  for (auto & [path, value] : copy.values_) {
    if (value.trend != Trend::None && value.space != nullptr) {
      value.levels = value.space->value_set_from_trend(value.levels, value.trend);
    }
  }
  return copy;
}

std::string WorldSnapshot::fingerprint() const
{
  std::string out;
  for (const auto & [path, value] : values_) {
    out += fmt::format("{}={:x}/{};", path.str(), value.levels.bits(), to_string(value.trend));
  }
  return out;
}

}  // namespace qualsim
