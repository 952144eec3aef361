// qualsim/model/snapshot.hpp - Attribute values and immutable world snapshots
#pragma once

#include <cstdint>
#include <map>
#include <string>

#include "qualsim/model/attribute_path.hpp"
#include "qualsim/model/qualitative_space.hpp"

namespace qualsim
{

// ============================================================================
// AttributeValue
// ============================================================================

/**
 * Possible levels of one attribute plus its current trend.
 *
 * A single-level set is a known value; more than one level means the value
 * is uncertain. The space is owned by the KnowledgeBase.
 */
struct AttributeValue
{
  const QualitativeSpace * space = nullptr;
  LevelSet levels;
  Trend trend = Trend::None;

  [[nodiscard]] bool is_known() const noexcept { return levels.is_single(); }
  [[nodiscard]] bool is_value_set() const noexcept { return levels.size() > 1; }

  /// Known and not moving.
  [[nodiscard]] bool is_fully_resolved() const noexcept
  {
    return is_known() && trend == Trend::None;
  }

  [[nodiscard]] AttributeValue with_levels(LevelSet l) const
  {
    return AttributeValue{space, l, trend};
  }

  [[nodiscard]] AttributeValue with_trend(Trend t) const
  {
    return AttributeValue{space, levels, t};
  }

  [[nodiscard]] std::string describe() const;

  friend bool operator==(const AttributeValue & a, const AttributeValue & b) noexcept
  {
    return a.space == b.space && a.levels == b.levels && a.trend == b.trend;
  }
};

// ============================================================================
// WorldSnapshot
// ============================================================================

/**
 * Complete assignment of every attribute of one object at one moment.
 *
 * Snapshots are never modified in place; the with_* methods return a copy
 * with one attribute overridden. The sequence marker orders snapshots
 * along a run and takes no part in equality or fingerprinting.
 */
class WorldSnapshot
{
public:
  using ValueMap = std::map<AttributePath, AttributeValue>;

  WorldSnapshot() = default;
  explicit WorldSnapshot(ValueMap values, uint64_t sequence = 0);

  [[nodiscard]] const ValueMap & values() const noexcept { return values_; }
  [[nodiscard]] uint64_t sequence() const noexcept { return sequence_; }
  [[nodiscard]] size_t size() const noexcept { return values_.size(); }

  [[nodiscard]] const AttributeValue * find(const AttributePath & path) const;
  [[nodiscard]] bool contains(const AttributePath & path) const { return find(path) != nullptr; }

  [[nodiscard]] WorldSnapshot with(const AttributePath & path, AttributeValue value) const;
  [[nodiscard]] WorldSnapshot with_levels(const AttributePath & path, LevelSet levels) const;
  [[nodiscard]] WorldSnapshot with_trend(const AttributePath & path, Trend trend) const;
  [[nodiscard]] WorldSnapshot with_sequence(uint64_t sequence) const;

  /**
   * Replaces every trended attribute's levels by the set its trend can
   * reach. Trends are kept, so a second call is a no-op.
   */
  [[nodiscard]] WorldSnapshot materialize_trends() const;

  /**
   * Canonical text of all (path, levels, trend) triples in path order.
   * Two snapshots describe the same state iff their fingerprints match.
   */
  [[nodiscard]] std::string fingerprint() const;

  friend bool operator==(const WorldSnapshot & a, const WorldSnapshot & b)
  {
    return a.values_ == b.values_;
  }

private:
  ValueMap values_;
  uint64_t sequence_ = 0;
};

}  // namespace qualsim
