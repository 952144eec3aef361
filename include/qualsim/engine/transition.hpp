// qualsim/engine/transition.hpp - Results produced by one action application
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qualsim/model/attribute_path.hpp"
#include "qualsim/model/qualitative_space.hpp"
#include "qualsim/model/snapshot.hpp"

namespace qualsim
{

// ============================================================================
// Errors
// ============================================================================

enum class ErrorKind : uint8_t {
  Validation,             ///< bad parameters or malformed action structure
  UnknownAction,          ///< no action or behaviour with that name
  ImmutableWrite,         ///< effect targets an immutable attribute
  Domain,                 ///< attribute missing from the snapshot
  UnknownLevel,           ///< value is not a level of the attribute's space
  RequiredPostcondition,  ///< conditional without else reached on its false side
};

[[nodiscard]] std::string_view to_string(ErrorKind kind) noexcept;

/**
 * Structured failure of a transition.
 *
 * Everything except RequiredPostcondition aborts the run; a required
 * postcondition only turns its own branch into an error node.
 */
struct TransitionError
{
  ErrorKind kind = ErrorKind::Validation;
  std::string message;

  [[nodiscard]] bool halts_run() const noexcept
  {
    return kind != ErrorKind::RequiredPostcondition;
  }

  [[nodiscard]] std::string describe() const;
};

// ============================================================================
// Status and provenance
// ============================================================================

enum class NodeStatus : uint8_t {
  Ok,
  Rejected,
  ConstraintViolated,
  Error,
};

[[nodiscard]] std::string_view to_string(NodeStatus status) noexcept;
[[nodiscard]] std::optional<NodeStatus> parse_node_status(std::string_view text);

enum class ConditionSource : uint8_t {
  Precondition,
  Postcondition,
};

enum class BranchType : uint8_t {
  Success,  ///< precondition held
  Fail,     ///< precondition violated
  If,       ///< first arm of a conditional effect
  Elif,     ///< nested conditional in an else
  Else,     ///< terminal else
};

enum class CompoundType : uint8_t {
  And,
  Or,
};

[[nodiscard]] std::string_view to_string(ConditionSource source) noexcept;
[[nodiscard]] std::string_view to_string(BranchType type) noexcept;
[[nodiscard]] std::string_view to_string(CompoundType type) noexcept;

/**
 * Why a child exists: which check split the parent and what the child
 * assumes about the attribute.
 *
 * `op` is the operator of the deciding check; `values` is the narrowed
 * level set this branch assumes. Compound decisions carry one
 * sub-condition per narrowed attribute.
 */
struct BranchCondition
{
  ConditionSource source = ConditionSource::Precondition;
  BranchType branch_type = BranchType::Success;
  AttributePath attribute;
  CompareOp op = CompareOp::Equals;
  std::vector<std::string> values;
  std::optional<CompoundType> compound_type;
  std::vector<BranchCondition> sub_conditions;

  [[nodiscard]] bool is_compound() const noexcept { return compound_type.has_value(); }
  [[nodiscard]] std::string describe() const;
};

// ============================================================================
// Changes
// ============================================================================

enum class ChangeKind : uint8_t {
  Value,       ///< levels written by an effect or by trend materialisation
  Trend,       ///< trend written by an effect
  Narrowing,   ///< levels restricted by a branch decision
  Constraint,  ///< attribute read by a violated dependency rule
};

[[nodiscard]] std::string_view to_string(ChangeKind kind) noexcept;
[[nodiscard]] std::optional<ChangeKind> parse_change_kind(std::string_view text);

struct Change
{
  AttributePath attribute;
  ChangeKind kind = ChangeKind::Value;
  AttributeValue before;
  AttributeValue after;

  [[nodiscard]] std::string describe() const;
};

/**
 * Appends @p change to @p log.
 *
 * A change for the same attribute and kind as the last entry is folded
 * into it; entries that end up changing nothing are dropped.
 */
void record_change(std::vector<Change> & log, Change change);

/// Re-applies @p change: trend for Trend changes, levels for the rest.
[[nodiscard]] WorldSnapshot apply_change(const WorldSnapshot & snapshot, const Change & change);

// ============================================================================
// TransitionResult
// ============================================================================

/**
 * One branch of an action application.
 *
 * `branch_state` is the parent snapshot restricted to this branch's
 * assumptions. `after` is set for Ok and ConstraintViolated results.
 */
struct TransitionResult
{
  NodeStatus status = NodeStatus::Ok;
  WorldSnapshot before;
  WorldSnapshot branch_state;
  std::optional<WorldSnapshot> after;
  std::vector<Change> changes;
  std::vector<std::string> violations;
  std::vector<std::string> undetermined_constraints;
  std::vector<BranchCondition> branch_conditions;  ///< decisions in the order taken
  std::optional<std::string> reason;               ///< why a precondition rejected
  std::optional<TransitionError> error;

  /// Snapshot the resulting tree node holds.
  [[nodiscard]] const WorldSnapshot & resulting_snapshot() const
  {
    return after ? *after : branch_state;
  }

  [[nodiscard]] const BranchCondition * last_branch_condition() const
  {
    return branch_conditions.empty() ? nullptr : &branch_conditions.back();
  }

  [[nodiscard]] bool halts_run() const noexcept { return error && error->halts_run(); }
};

}  // namespace qualsim
