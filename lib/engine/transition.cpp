// qualsim/engine/transition.cpp
#include "qualsim/engine/transition.hpp"

#include <fmt/core.h>

#include <utility>

#include "qualsim/model/condition.hpp"

namespace qualsim
{

std::string_view to_string(ErrorKind kind) noexcept
{
  switch (kind) {
    case ErrorKind::Validation:
      return "ValidationError";
    case ErrorKind::UnknownAction:
      return "UnknownAction";
    case ErrorKind::ImmutableWrite:
      return "ImmutableWriteError";
    case ErrorKind::Domain:
      return "DomainError";
    case ErrorKind::UnknownLevel:
      return "UnknownLevel";
    case ErrorKind::RequiredPostcondition:
      return "RequiredPostconditionError";
  }
  return "ValidationError";
}

std::string TransitionError::describe() const
{
  return fmt::format("{}: {}", to_string(kind), message);
}

std::string_view to_string(NodeStatus status) noexcept
{
  switch (status) {
    case NodeStatus::Ok:
      return "ok";
    case NodeStatus::Rejected:
      return "rejected";
    case NodeStatus::ConstraintViolated:
      return "constraint_violated";
    case NodeStatus::Error:
      return "error";
  }
  return "ok";
}

std::optional<NodeStatus> parse_node_status(std::string_view text)
{
  if (text == "ok") return NodeStatus::Ok;
  if (text == "rejected") return NodeStatus::Rejected;
  if (text == "constraint_violated") return NodeStatus::ConstraintViolated;
  if (text == "error") return NodeStatus::Error;
  return std::nullopt;
}

std::string_view to_string(ConditionSource source) noexcept
{
  return source == ConditionSource::Precondition ? "precondition" : "postcondition";
}

std::string_view to_string(BranchType type) noexcept
{
  switch (type) {
    case BranchType::Success:
      return "success";
    case BranchType::Fail:
      return "fail";
    case BranchType::If:
      return "if";
    case BranchType::Elif:
      return "elif";
    case BranchType::Else:
      return "else";
  }
  return "success";
}

std::string_view to_string(CompoundType type) noexcept
{
  return type == CompoundType::And ? "and" : "or";
}

namespace
{

std::string describe_body(const BranchCondition & bc)
{
  if (bc.is_compound()) {
    const std::string_view sep = *bc.compound_type == CompoundType::And ? " and " : " or ";
    std::string body;
    for (size_t i = 0; i < bc.sub_conditions.size(); ++i) {
      if (i > 0) {
        body += sep;
      }
      body += describe_body(bc.sub_conditions[i]);
    }
    return body;
  }
  std::string value_text;
  for (size_t i = 0; i < bc.values.size(); ++i) {
    value_text += i > 0 ? ", " + bc.values[i] : bc.values[i];
  }
  if (bc.values.size() == 1) {
    return fmt::format("{} == {}", bc.attribute.str(), value_text);
  }
  return fmt::format("{} in {{{}}}", bc.attribute.str(), value_text);
}

}  // namespace

std::string BranchCondition::describe() const
{
  return fmt::format("[{} {}] {}", to_string(source), to_string(branch_type), describe_body(*this));
}

std::string_view to_string(ChangeKind kind) noexcept
{
  switch (kind) {
    case ChangeKind::Value:
      return "value";
    case ChangeKind::Trend:
      return "trend";
    case ChangeKind::Narrowing:
      return "narrowing";
    case ChangeKind::Constraint:
      return "constraint";
  }
  return "value";
}

std::optional<ChangeKind> parse_change_kind(std::string_view text)
{
  if (text == "value") return ChangeKind::Value;
  if (text == "trend") return ChangeKind::Trend;
  if (text == "narrowing") return ChangeKind::Narrowing;
  if (text == "constraint") return ChangeKind::Constraint;
  return std::nullopt;
}

std::string Change::describe() const
{
  if (kind == ChangeKind::Trend) {
    return fmt::format(
      "{} trend: {} -> {}", attribute.str(), to_string(before.trend), to_string(after.trend));
  }
  const QualitativeSpace * space = after.space != nullptr ? after.space : before.space;
  if (space == nullptr) {
    return attribute.str();
  }
  return fmt::format(
    "{} ({}): {} -> {}", attribute.str(), to_string(kind), space->describe(before.levels),
    space->describe(after.levels));
}

namespace
{

bool is_noop(const Change & c)
{
  if (c.kind == ChangeKind::Constraint) {
    return false;
  }
  if (c.kind == ChangeKind::Trend) {
    return c.before.trend == c.after.trend;
  }
  return c.before.levels == c.after.levels;
}

}  // namespace

void record_change(std::vector<Change> & log, Change change)
{
  if (change.kind != ChangeKind::Constraint && !log.empty()) {
    Change & last = log.back();
    if (last.attribute == change.attribute && last.kind == change.kind) {
      last.after = change.after;
      if (is_noop(last)) {
        log.pop_back();
      }
      return;
    }
  }
  if (!is_noop(change)) {
    log.push_back(std::move(change));
  }
}

WorldSnapshot apply_change(const WorldSnapshot & snapshot, const Change & change)
{
  switch (change.kind) {
    case ChangeKind::Trend:
      return snapshot.with_trend(change.attribute, change.after.trend);
    case ChangeKind::Value:
    case ChangeKind::Narrowing:
      return snapshot.with_levels(change.attribute, change.after.levels);
    case ChangeKind::Constraint:
      break;
  }
  return snapshot;
}

}  // namespace qualsim
