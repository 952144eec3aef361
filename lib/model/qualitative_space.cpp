// qualsim/model/qualitative_space.cpp - Level sets and ordered domains
#include "qualsim/model/qualitative_space.hpp"

#include <algorithm>
#include <bit>
#include <utility>

namespace qualsim
{

// ============================================================================
// LevelSet
// ============================================================================

LevelSet LevelSet::range(size_t first, size_t last) noexcept
{
  if (first > last || first >= k_max_levels) {
    return {};
  }
  last = std::min(last, k_max_levels - 1);
  const uint64_t upper = last == k_max_levels - 1 ? ~uint64_t{0} : (uint64_t{1} << (last + 1)) - 1;
  const uint64_t lower = (uint64_t{1} << first) - 1;
  return from_bits(upper & ~lower);
}

LevelSet LevelSet::all(size_t count) noexcept
{
  if (count == 0) {
    return {};
  }
  return range(0, count - 1);
}

size_t LevelSet::size() const noexcept { return static_cast<size_t>(std::popcount(bits_)); }

size_t LevelSet::first() const noexcept { return static_cast<size_t>(std::countr_zero(bits_)); }

size_t LevelSet::last() const noexcept
{
  return k_max_levels - 1 - static_cast<size_t>(std::countl_zero(bits_));
}

std::vector<size_t> LevelSet::indices() const
{
  std::vector<size_t> out;
  out.reserve(size());
  uint64_t rest = bits_;
  while (rest != 0) {
    out.push_back(static_cast<size_t>(std::countr_zero(rest)));
    rest &= rest - 1;
  }
  return out;
}

// ============================================================================
// Operators and trends
// ============================================================================

std::string_view to_string(CompareOp op) noexcept
{
  switch (op) {
    case CompareOp::Equals:
      return "equals";
    case CompareOp::NotEquals:
      return "not_equals";
    case CompareOp::Lt:
      return "lt";
    case CompareOp::Lte:
      return "lte";
    case CompareOp::Gt:
      return "gt";
    case CompareOp::Gte:
      return "gte";
    case CompareOp::In:
      return "in";
    case CompareOp::NotIn:
      return "not_in";
  }
  return "equals";
}

std::optional<CompareOp> parse_compare_op(std::string_view text)
{
  if (text == "equals" || text == "==" || text == "eq") return CompareOp::Equals;
  if (text == "not_equals" || text == "!=" || text == "ne") return CompareOp::NotEquals;
  if (text == "lt" || text == "<") return CompareOp::Lt;
  if (text == "lte" || text == "<=") return CompareOp::Lte;
  if (text == "gt" || text == ">") return CompareOp::Gt;
  if (text == "gte" || text == ">=") return CompareOp::Gte;
  if (text == "in") return CompareOp::In;
  if (text == "not_in") return CompareOp::NotIn;
  return std::nullopt;
}

bool is_ordered(CompareOp op) noexcept
{
  return op == CompareOp::Lt || op == CompareOp::Lte || op == CompareOp::Gt ||
         op == CompareOp::Gte;
}

std::string_view to_string(Trend trend) noexcept
{
  switch (trend) {
    case Trend::None:
      return "none";
    case Trend::Up:
      return "up";
    case Trend::Down:
      return "down";
  }
  return "none";
}

std::optional<Trend> parse_trend(std::string_view text)
{
  if (text == "none") return Trend::None;
  if (text == "up") return Trend::Up;
  if (text == "down") return Trend::Down;
  return std::nullopt;
}

// ============================================================================
// QualitativeSpace
// ============================================================================

QualitativeSpace::QualitativeSpace(std::string id, std::string name, std::vector<std::string> levels)
: id_(std::move(id)), name_(std::move(name)), levels_(std::move(levels))
{
}

std::optional<size_t> QualitativeSpace::index_of(std::string_view level) const
{
  const auto it = std::find(levels_.begin(), levels_.end(), level);
  if (it == levels_.end()) {
    return std::nullopt;
  }
  return static_cast<size_t>(std::distance(levels_.begin(), it));
}

std::optional<LevelSet> QualitativeSpace::resolve(const std::vector<std::string> & names) const
{
  LevelSet out;
  for (const auto & n : names) {
    const auto idx = index_of(n);
    if (!idx) {
      return std::nullopt;
    }
    out.insert(*idx);
  }
  return out;
}

LevelSet QualitativeSpace::expand(CompareOp op, LevelSet operand) const noexcept
{
  const LevelSet everything = all();
  if (operand.empty()) {
    return op == CompareOp::NotEquals || op == CompareOp::NotIn ? everything : LevelSet{};
  }

  const size_t pivot = operand.first();
  const size_t top = levels_.empty() ? 0 : levels_.size() - 1;
  switch (op) {
    case CompareOp::Equals:
    case CompareOp::In:
      return operand & everything;
    case CompareOp::NotEquals:
    case CompareOp::NotIn:
      return everything - operand;
    case CompareOp::Lt:
      return pivot == 0 ? LevelSet{} : LevelSet::range(0, pivot - 1);
    case CompareOp::Lte:
      return LevelSet::range(0, pivot);
    case CompareOp::Gt:
      return pivot >= top ? LevelSet{} : LevelSet::range(pivot + 1, top);
    case CompareOp::Gte:
      return LevelSet::range(pivot, top);
  }
  return {};
}

size_t QualitativeSpace::step(size_t index, Trend trend) const noexcept
{
  switch (trend) {
    case Trend::Up:
      return index + 1 < levels_.size() ? index + 1 : index;
    case Trend::Down:
      return index > 0 ? index - 1 : index;
    case Trend::None:
      break;
  }
  return index;
}

LevelSet QualitativeSpace::value_set_from_trend(LevelSet current, Trend trend) const noexcept
{
  if (current.empty()) {
    return current;
  }
  switch (trend) {
    case Trend::Down:
      return LevelSet::range(0, current.last());
    case Trend::Up:
      return LevelSet::range(current.first(), levels_.size() - 1);
    case Trend::None:
      break;
  }
  return current;
}

std::vector<std::string> QualitativeSpace::names(LevelSet set) const
{
  std::vector<std::string> out;
  for (const size_t i : set.indices()) {
    if (i < levels_.size()) {
      out.push_back(levels_[i]);
    }
  }
  return out;
}

std::string QualitativeSpace::describe(LevelSet set) const
{
  const auto parts = names(set);
  if (parts.size() == 1) {
    return parts.front();
  }
  std::string out = "{";
  for (size_t i = 0; i < parts.size(); ++i) {
    if (i > 0) {
      out += ", ";
    }
    out += parts[i];
  }
  out += "}";
  return out;
}

}  // namespace qualsim
