// qualsim/engine/transition_engine.hpp - One action applied to one snapshot
#pragma once

#include <vector>

#include "qualsim/engine/constraint_checker.hpp"
#include "qualsim/engine/transition.hpp"
#include "qualsim/model/action.hpp"
#include "qualsim/model/object_type.hpp"
#include "qualsim/model/snapshot.hpp"

namespace qualsim
{

/**
 * Applies an action to a snapshot and returns every reachable outcome.
 *
 * Processing order:
 *  1. structural and parameter validation (a single Error result on failure);
 *  2. trended attributes are widened to the levels their trend can reach;
 *  3. the preconditions, combined with and, are split into success and
 *     fail branches; fail branches become Rejected results;
 *  4. effects run on each success branch, forking on undecidable
 *     conditional effects;
 *  5. dependency rules are checked on each finished branch.
 *
 * Success-side results come first, in the order the branches were
 * produced, followed by the rejected ones. The engine holds no state
 * between calls and may be used from several threads at once.
 */
class TransitionEngine
{
public:
  explicit TransitionEngine(const ObjectType & type) : type_(type), checker_(type) {}

  [[nodiscard]] std::vector<TransitionResult> apply(
    const WorldSnapshot & before, const Action & action, const ParameterMap & parameters) const;

  [[nodiscard]] const ObjectType & object_type() const noexcept { return type_; }

private:
  [[nodiscard]] static TransitionResult failure(const WorldSnapshot & before, TransitionError error);

  const ObjectType & type_;
  ConstraintChecker checker_;
};

}  // namespace qualsim
