// qualsim/graph/simulation_graph.hpp - Layered state DAG produced by a run
#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qualsim/engine/transition.hpp"
#include "qualsim/model/action.hpp"
#include "qualsim/model/snapshot.hpp"

namespace qualsim
{

using NodeId = uint32_t;

/**
 * One way of reaching a node: the parent, the decision that led here and
 * what changed on the way.
 */
struct IncomingEdge
{
  NodeId parent = 0;
  ParameterMap parameters;
  std::optional<BranchCondition> branch_condition;  ///< last decision taken
  std::vector<BranchCondition> branch_path;         ///< every decision taken
  std::vector<Change> changes;
  std::vector<std::string> violations;
  std::vector<std::string> undetermined_constraints;
  std::optional<std::string> reason;
  std::optional<TransitionError> error;
};

/**
 * A world state in the graph.
 *
 * Merged nodes have several parents; `incoming[i]` describes the edge from
 * `parent_ids[i]`. The first edge is the primary one.
 */
struct TreeNode
{
  NodeId id = 0;
  uint32_t layer = 0;
  WorldSnapshot snapshot;
  NodeStatus status = NodeStatus::Ok;
  std::string action_name;  ///< empty on the root
  std::vector<NodeId> parent_ids;
  std::vector<NodeId> children_ids;
  std::vector<IncomingEdge> incoming;

  /// "state{N}".
  [[nodiscard]] std::string name() const;

  [[nodiscard]] bool is_root() const noexcept { return parent_ids.empty(); }
  [[nodiscard]] bool is_leaf() const noexcept { return children_ids.empty(); }
  [[nodiscard]] bool is_merged() const noexcept { return parent_ids.size() > 1; }

  [[nodiscard]] const IncomingEdge * primary_edge() const
  {
    return incoming.empty() ? nullptr : &incoming.front();
  }
};

struct GraphStatistics
{
  size_t total_nodes = 0;
  size_t depth = 0;  ///< number of layers below the root
  size_t max_width = 0;
  size_t leaf_count = 0;
  size_t branch_points = 0;  ///< nodes with more than one child
  size_t merged_nodes = 0;
  size_t edge_count = 0;
  size_t successful = 0;  ///< Ok nodes, root included
  size_t failed = 0;      ///< Rejected, ConstraintViolated and Error nodes
};

/**
 * Arena of TreeNodes addressed by NodeId.
 *
 * Nodes are only ever appended; ids are dense and equal to creation order,
 * so the graph is trivially deterministic given the same inputs.
 */
class SimulationGraph
{
public:
  SimulationGraph() = default;
  SimulationGraph(std::string simulation_id, std::string object_type);

  [[nodiscard]] const std::string & simulation_id() const noexcept { return simulation_id_; }
  [[nodiscard]] const std::string & object_type() const noexcept { return object_type_; }

  [[nodiscard]] bool empty() const noexcept { return nodes_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return nodes_.size(); }

  /// Root is always id 0. Undefined on an empty graph.
  [[nodiscard]] const TreeNode & root() const { return nodes_.front(); }

  [[nodiscard]] const TreeNode & node(NodeId id) const { return nodes_.at(id); }
  [[nodiscard]] const TreeNode * find(std::string_view name) const;
  [[nodiscard]] const std::vector<TreeNode> & nodes() const noexcept { return nodes_; }

  [[nodiscard]] std::vector<NodeId> layer(uint32_t index) const;
  [[nodiscard]] std::vector<NodeId> leaves() const;

  /// Node ids from the root to @p id following primary parents.
  [[nodiscard]] std::vector<NodeId> path_to(NodeId id) const;

  [[nodiscard]] GraphStatistics statistics() const;

  // Mutation (NodeFactory only)
  NodeId add_node(TreeNode node);
  void add_edge(NodeId child, IncomingEdge edge);
  [[nodiscard]] TreeNode & mutable_node(NodeId id) { return nodes_.at(id); }

  [[nodiscard]] const std::vector<std::string> & actions() const noexcept { return actions_; }
  void append_action(std::string name) { actions_.push_back(std::move(name)); }

private:
  std::string simulation_id_;
  std::string object_type_;
  std::vector<std::string> actions_;
  std::vector<TreeNode> nodes_;
};

[[nodiscard]] std::string node_name(NodeId id);

}  // namespace qualsim
