// qualsim/engine/branch_generator.hpp - Splitting uncertain conditions into branches
#pragma once

#include <optional>
#include <vector>

#include "qualsim/engine/condition_evaluator.hpp"
#include "qualsim/engine/transition.hpp"
#include "qualsim/model/condition.hpp"
#include "qualsim/model/snapshot.hpp"

namespace qualsim
{

/**
 * One narrowing assumption: `path` is restricted to `levels`.
 * `op` is the operator of the check that produced it.
 */
struct Restriction
{
  AttributePath path;
  CompareOp op = CompareOp::Equals;
  LevelSet levels;

  friend bool operator==(const Restriction & a, const Restriction & b) noexcept
  {
    return a.path == b.path && a.levels == b.levels;
  }
};

/// Simultaneous restrictions describing one branch, at most one per path.
using Assumption = std::vector<Restriction>;

/**
 * A condition split against one snapshot.
 *
 * Every success assumption makes the condition True once applied; every
 * fail assumption makes it False. A definite True yields one empty
 * success assumption and no fail, a definite False the reverse.
 */
struct Split
{
  Truth truth = Truth::False;
  std::vector<Assumption> success;
  std::vector<Assumption> fail;
  std::optional<TransitionError> error;
};

/**
 * Produces the branch alternatives for preconditions and conditional
 * effects.
 *
 * For an uncertain check with current set C and satisfying set S the
 * success branch assumes C & S and the fail branch C - S. Compounds follow
 * De Morgan:
 *  - and: one success branch (all items narrowed together) and one fail
 *    branch per uncertain item, each narrowing only that item;
 *  - or: one success branch per uncertain item and one fail branch
 *    narrowing every item to its failing part.
 * Implications split as `not antecedent or consequent`.
 */
class BranchGenerator
{
public:
  explicit BranchGenerator(const ConditionEvaluator & evaluator) : evaluator_(evaluator) {}

  [[nodiscard]] Split split(const Condition & condition, const WorldSnapshot & snapshot) const;

  /**
   * Applies @p assumption to @p snapshot, logging one Narrowing change per
   * attribute that actually shrank.
   */
  [[nodiscard]] static WorldSnapshot narrow(
    const WorldSnapshot & snapshot, const Assumption & assumption, std::vector<Change> & log);

  /**
   * Builds the BranchCondition recorded on a child.
   *
   * @param compound Connective of the deciding condition on this side, if
   *                 it has more than one item.
   */
  [[nodiscard]] static BranchCondition describe_branch(
    const Assumption & assumption, const WorldSnapshot & snapshot, ConditionSource source,
    BranchType type, std::optional<CompoundType> compound);

  /**
   * Connective of @p condition seen from its success side, looking
   * through negations. std::nullopt for leaves and single-item compounds.
   */
  [[nodiscard]] static std::optional<CompoundType> compound_type_of(const Condition & condition);

  [[nodiscard]] static std::optional<CompoundType> flip(std::optional<CompoundType> type);

private:
  [[nodiscard]] Split split_unknown(const Condition & condition, const WorldSnapshot & snapshot) const;

  const ConditionEvaluator & evaluator_;
};

}  // namespace qualsim
