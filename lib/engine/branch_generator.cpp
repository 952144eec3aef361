// qualsim/engine/branch_generator.cpp
#include "qualsim/engine/branch_generator.hpp"

#include <algorithm>
#include <type_traits>
#include <utility>

namespace qualsim
{

namespace
{

template <typename>
inline constexpr bool always_false_v = false;

/// Intersects two assumptions; std::nullopt when some path becomes empty.
std::optional<Assumption> merge(const Assumption & a, const Assumption & b)
{
  Assumption out = a;
  for (const auto & r : b) {
    auto it = std::find_if(
      out.begin(), out.end(), [&r](const Restriction & x) { return x.path == r.path; });
    if (it == out.end()) {
      out.push_back(r);
      continue;
    }
    it->levels = it->levels & r.levels;
    it->op = r.op;
    if (it->levels.empty()) {
      return std::nullopt;
    }
  }
  std::sort(out.begin(), out.end(), [](const Restriction & x, const Restriction & y) {
    return x.path < y.path;
  });
  return out;
}

void push_unique(std::vector<Assumption> & into, Assumption a)
{
  if (std::find(into.begin(), into.end(), a) == into.end()) {
    into.push_back(std::move(a));
  }
}

void append_unique(std::vector<Assumption> & into, const std::vector<Assumption> & from)
{
  for (const auto & a : from) {
    push_unique(into, a);
  }
}

/// Every feasible combination picking one assumption from each list.
std::vector<Assumption> product(const std::vector<std::vector<Assumption>> & lists)
{
  std::vector<Assumption> acc{Assumption{}};
  for (const auto & list : lists) {
    std::vector<Assumption> next;
    for (const auto & x : acc) {
      for (const auto & y : list) {
        if (auto m = merge(x, y)) {
          push_unique(next, std::move(*m));
        }
      }
    }
    acc = std::move(next);
  }
  return acc;
}

Split swapped(Split s)
{
  std::swap(s.success, s.fail);
  if (s.truth == Truth::True) {
    s.truth = Truth::False;
  } else if (s.truth == Truth::False) {
    s.truth = Truth::True;
  }
  return s;
}

Split combine_all(const std::vector<Split> & parts)
{
  Split out;
  out.truth = Truth::Unknown;
  std::vector<std::vector<Assumption>> successes;
  for (const auto & p : parts) {
    successes.push_back(p.success);
    if (p.truth == Truth::Unknown) {
      append_unique(out.fail, p.fail);
    }
  }
  out.success = product(successes);
  return out;
}

Split combine_any(const std::vector<Split> & parts)
{
  Split out;
  out.truth = Truth::Unknown;
  std::vector<std::vector<Assumption>> fails;
  for (const auto & p : parts) {
    fails.push_back(p.fail);
    if (p.truth == Truth::Unknown) {
      append_unique(out.success, p.success);
    }
  }
  out.fail = product(fails);
  return out;
}

}  // namespace

Split BranchGenerator::split(const Condition & condition, const WorldSnapshot & snapshot) const
{
  Evaluation e = evaluator_.evaluate(condition, snapshot);
  Split out;
  if (!e.ok()) {
    out.error = std::move(e.error);
    return out;
  }
  out.truth = e.truth;
  switch (e.truth) {
    case Truth::True:
      out.success.emplace_back();
      return out;
    case Truth::False:
      out.fail.emplace_back();
      return out;
    case Truth::Unknown:
      break;
  }
  return split_unknown(condition, snapshot);
}

Split BranchGenerator::split_unknown(const Condition & condition, const WorldSnapshot & snapshot) const
{
  auto split_items = [this, &snapshot](const std::vector<Condition> & items, Split & failed) {
    std::vector<Split> parts;
    parts.reserve(items.size());
    for (const auto & item : items) {
      Split s = split(item, snapshot);
      if (s.error) {
        failed.error = std::move(s.error);
        return parts;
      }
      parts.push_back(std::move(s));
    }
    return parts;
  };

  return std::visit(
    [&](const auto & c) -> Split {
      using T = std::decay_t<decltype(c)>;
      Split failed;
      if constexpr (std::is_same_v<T, AttributeCheck>) {
        ResolvedCheck r = evaluator_.resolve(c, snapshot);
        if (r.error) {
          failed.error = std::move(r.error);
          return failed;
        }
        const LevelSet current = r.current->levels;
        Split out;
        out.truth = Truth::Unknown;
        out.success.push_back(Assumption{Restriction{c.target, c.op, current & r.satisfying}});
        out.fail.push_back(Assumption{Restriction{c.target, c.op, current - r.satisfying}});
        return out;
      } else if constexpr (std::is_same_v<T, ParameterCheck>) {
        // parameters are always known, so this is unreachable for Unknown
        return failed;
      } else if constexpr (std::is_same_v<T, Box<AndCondition>>) {
        auto parts = split_items(c->items, failed);
        return failed.error ? failed : combine_all(parts);
      } else if constexpr (std::is_same_v<T, Box<OrCondition>>) {
        auto parts = split_items(c->items, failed);
        return failed.error ? failed : combine_any(parts);
      } else if constexpr (std::is_same_v<T, Box<NotCondition>>) {
        return swapped(split(c->item, snapshot));
      } else if constexpr (std::is_same_v<T, Box<ImplicationCondition>>) {
        Split a = split(c->antecedent, snapshot);
        if (a.error) {
          return a;
        }
        Split b = split(c->consequent, snapshot);
        if (b.error) {
          return b;
        }
        return combine_any({swapped(std::move(a)), std::move(b)});
      } else {
        static_assert(always_false_v<T>, "unhandled condition kind");
      }
    },
    condition);
}

WorldSnapshot BranchGenerator::narrow(
  const WorldSnapshot & snapshot, const Assumption & assumption, std::vector<Change> & log)
{
  WorldSnapshot out = snapshot;
  for (const auto & r : assumption) {
    const AttributeValue * current = out.find(r.path);
    if (current == nullptr) {
      continue;
    }
    const AttributeValue narrowed = current->with_levels(current->levels & r.levels);
    record_change(log, Change{r.path, ChangeKind::Narrowing, *current, narrowed});
    out = out.with(r.path, narrowed);
  }
  return out;
}

BranchCondition BranchGenerator::describe_branch(
  const Assumption & assumption, const WorldSnapshot & snapshot, ConditionSource source,
  BranchType type, std::optional<CompoundType> compound)
{
  auto leaf = [&](const Restriction & r) {
    BranchCondition bc;
    bc.source = source;
    bc.branch_type = type;
    bc.attribute = r.path;
    bc.op = r.op;
    const AttributeValue * v = snapshot.find(r.path);
    if (v != nullptr && v->space != nullptr) {
      bc.values = v->space->names(r.levels);
    }
    return bc;
  };

  if (assumption.empty()) {
    BranchCondition bc;
    bc.source = source;
    bc.branch_type = type;
    return bc;
  }
  if (assumption.size() == 1 && !compound) {
    return leaf(assumption.front());
  }

  BranchCondition bc = leaf(assumption.front());
  bc.compound_type = compound.value_or(CompoundType::And);
  for (const auto & r : assumption) {
    bc.sub_conditions.push_back(leaf(r));
  }
  return bc;
}

std::optional<CompoundType> BranchGenerator::compound_type_of(const Condition & condition)
{
  if (const auto * a = std::get_if<Box<AndCondition>>(&condition)) {
    return (*a)->items.size() > 1 ? std::optional<CompoundType>(CompoundType::And) : std::nullopt;
  }
  if (const auto * o = std::get_if<Box<OrCondition>>(&condition)) {
    return (*o)->items.size() > 1 ? std::optional<CompoundType>(CompoundType::Or) : std::nullopt;
  }
  if (const auto * n = std::get_if<Box<NotCondition>>(&condition)) {
    return flip(compound_type_of((*n)->item));
  }
  if (std::holds_alternative<Box<ImplicationCondition>>(condition)) {
    return CompoundType::Or;
  }
  return std::nullopt;
}

std::optional<CompoundType> BranchGenerator::flip(std::optional<CompoundType> type)
{
  if (!type) {
    return std::nullopt;
  }
  return *type == CompoundType::And ? CompoundType::Or : CompoundType::And;
}

}  // namespace qualsim
