// qualsim/model/qualitative_space.hpp - Ordered finite value domains
#pragma once

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace qualsim
{

/// Spaces are bounded so a value set fits one machine word.
inline constexpr size_t k_max_levels = 64;

// ============================================================================
// LevelSet
// ============================================================================

/**
 * Set of level indices within one QualitativeSpace.
 *
 * Bit i is set when level i (in the space's ascending order) is a
 * possible value. Iteration and printing always follow space order.
 */
class LevelSet
{
public:
  constexpr LevelSet() noexcept = default;

  [[nodiscard]] static constexpr LevelSet from_bits(uint64_t bits) noexcept
  {
    LevelSet s;
    s.bits_ = bits;
    return s;
  }

  [[nodiscard]] static constexpr LevelSet single(size_t index) noexcept
  {
    return from_bits(uint64_t{1} << index);
  }

  /// Levels [first, last], both inclusive.
  [[nodiscard]] static LevelSet range(size_t first, size_t last) noexcept;

  [[nodiscard]] static LevelSet all(size_t count) noexcept;

  [[nodiscard]] constexpr uint64_t bits() const noexcept { return bits_; }
  [[nodiscard]] constexpr bool empty() const noexcept { return bits_ == 0; }
  [[nodiscard]] size_t size() const noexcept;
  [[nodiscard]] bool is_single() const noexcept { return size() == 1; }

  [[nodiscard]] constexpr bool contains(size_t index) const noexcept
  {
    return index < k_max_levels && (bits_ >> index & 1U) != 0;
  }

  void insert(size_t index) noexcept { bits_ |= uint64_t{1} << index; }

  /// Lowest level index. Undefined on an empty set.
  [[nodiscard]] size_t first() const noexcept;

  /// Highest level index. Undefined on an empty set.
  [[nodiscard]] size_t last() const noexcept;

  [[nodiscard]] std::vector<size_t> indices() const;

  [[nodiscard]] constexpr bool is_subset_of(LevelSet other) const noexcept
  {
    return (bits_ & ~other.bits_) == 0;
  }

  [[nodiscard]] constexpr bool intersects(LevelSet other) const noexcept
  {
    return (bits_ & other.bits_) != 0;
  }

  [[nodiscard]] constexpr LevelSet operator&(LevelSet other) const noexcept
  {
    return from_bits(bits_ & other.bits_);
  }

  [[nodiscard]] constexpr LevelSet operator|(LevelSet other) const noexcept
  {
    return from_bits(bits_ | other.bits_);
  }

  /// Set difference.
  [[nodiscard]] constexpr LevelSet operator-(LevelSet other) const noexcept
  {
    return from_bits(bits_ & ~other.bits_);
  }

  constexpr bool operator==(const LevelSet &) const noexcept = default;

private:
  uint64_t bits_ = 0;
};

// ============================================================================
// Operators and trends
// ============================================================================

enum class CompareOp : uint8_t {
  Equals,
  NotEquals,
  Lt,
  Lte,
  Gt,
  Gte,
  In,
  NotIn,
};

[[nodiscard]] std::string_view to_string(CompareOp op) noexcept;

/// Accepts the YAML spellings (equals, ==, not_equals, !=, lt, <, ...).
[[nodiscard]] std::optional<CompareOp> parse_compare_op(std::string_view text);

/// True for lt/lte/gt/gte, which compare against a single pivot level.
[[nodiscard]] bool is_ordered(CompareOp op) noexcept;

enum class Trend : uint8_t {
  None,
  Up,
  Down,
};

[[nodiscard]] std::string_view to_string(Trend trend) noexcept;
[[nodiscard]] std::optional<Trend> parse_trend(std::string_view text);

// ============================================================================
// QualitativeSpace
// ============================================================================

/**
 * Named, totally ordered list of discrete levels (e.g. empty < low < full).
 */
class QualitativeSpace
{
public:
  QualitativeSpace(std::string id, std::string name, std::vector<std::string> levels);

  [[nodiscard]] const std::string & id() const noexcept { return id_; }
  [[nodiscard]] const std::string & name() const noexcept { return name_; }
  [[nodiscard]] const std::vector<std::string> & levels() const noexcept { return levels_; }
  [[nodiscard]] size_t size() const noexcept { return levels_.size(); }

  [[nodiscard]] std::optional<size_t> index_of(std::string_view level) const;
  [[nodiscard]] bool has_level(std::string_view level) const { return index_of(level).has_value(); }
  [[nodiscard]] const std::string & level_name(size_t index) const { return levels_.at(index); }

  [[nodiscard]] LevelSet all() const noexcept { return LevelSet::all(levels_.size()); }

  /// Maps level names to a set; std::nullopt if any name is not a level.
  [[nodiscard]] std::optional<LevelSet> resolve(const std::vector<std::string> & names) const;

  /**
   * Levels satisfying `x <op> operand`.
   *
   * Ordered operators use the lowest level of @p operand as the pivot, so
   * callers are expected to pass a single level for them. Equals/In return
   * the operand itself, NotEquals/NotIn its complement.
   */
  [[nodiscard]] LevelSet expand(CompareOp op, LevelSet operand) const noexcept;

  /// Neighbouring level in the trend direction, clamped at both ends.
  [[nodiscard]] size_t step(size_t index, Trend trend) const noexcept;

  /**
   * Every level reachable from @p current by following @p trend.
   *
   * Down yields everything at or below the highest current level, Up
   * everything at or above the lowest, None returns @p current unchanged.
   */
  [[nodiscard]] LevelSet value_set_from_trend(LevelSet current, Trend trend) const noexcept;

  [[nodiscard]] std::vector<std::string> names(LevelSet set) const;

  /// "medium" for a single level, "{low, medium}" otherwise.
  [[nodiscard]] std::string describe(LevelSet set) const;

private:
  std::string id_;
  std::string name_;
  std::vector<std::string> levels_;
};

}  // namespace qualsim
