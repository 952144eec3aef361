// qualsim/graph/node_factory.cpp
#include "qualsim/graph/node_factory.hpp"

#include <fmt/core.h>

#include <utility>

namespace qualsim
{

NodeId NodeFactory::create_root(WorldSnapshot snapshot)
{
  TreeNode root;
  root.layer = 0;
  root.snapshot = std::move(snapshot);
  root.status = NodeStatus::Ok;
  layer_ = 0;
  return graph_.add_node(std::move(root));
}

void NodeFactory::begin_layer()
{
  layer_index_.clear();
  merged_in_layer_ = 0;
  ++layer_;
}

std::string NodeFactory::merge_key(const WorldSnapshot & snapshot, NodeStatus status)
{
  return fmt::format("{}#{}", snapshot.fingerprint(), to_string(status));
}

Placement NodeFactory::create_or_merge(
  NodeId parent, const std::string & action_name, const ParameterMap & parameters,
  TransitionResult result)
{
  IncomingEdge edge;
  edge.parent = parent;
  edge.parameters = parameters;
  if (const BranchCondition * last = result.last_branch_condition()) {
    edge.branch_condition = *last;
  }
  edge.branch_path = std::move(result.branch_conditions);
  edge.changes = std::move(result.changes);
  edge.violations = std::move(result.violations);
  edge.undetermined_constraints = std::move(result.undetermined_constraints);
  edge.reason = std::move(result.reason);
  edge.error = std::move(result.error);

  WorldSnapshot snapshot =
    result.after ? std::move(*result.after) : std::move(result.branch_state);
  std::string key = merge_key(snapshot, result.status);

  const auto existing = layer_index_.find(key);
  if (existing != layer_index_.end()) {
    graph_.add_edge(existing->second, std::move(edge));
    ++merged_in_layer_;
    return Placement{existing->second, true};
  }

  TreeNode node;
  node.layer = layer_;
  node.snapshot = std::move(snapshot);
  node.status = result.status;
  node.action_name = action_name;
  const NodeId id = graph_.add_node(std::move(node));
  graph_.add_edge(id, std::move(edge));
  layer_index_.emplace(std::move(key), id);
  return Placement{id, false};
}

}  // namespace qualsim
