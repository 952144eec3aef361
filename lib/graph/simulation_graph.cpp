// qualsim/graph/simulation_graph.cpp
#include "qualsim/graph/simulation_graph.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <map>
#include <utility>

namespace qualsim
{

std::string node_name(NodeId id) { return fmt::format("state{}", id); }

std::string TreeNode::name() const { return node_name(id); }

SimulationGraph::SimulationGraph(std::string simulation_id, std::string object_type)
: simulation_id_(std::move(simulation_id)), object_type_(std::move(object_type))
{
}

const TreeNode * SimulationGraph::find(std::string_view name) const
{
  for (const auto & n : nodes_) {
    if (n.name() == name) {
      return &n;
    }
  }
  return nullptr;
}

std::vector<NodeId> SimulationGraph::layer(uint32_t index) const
{
  std::vector<NodeId> out;
  for (const auto & n : nodes_) {
    if (n.layer == index) {
      out.push_back(n.id);
    }
  }
  return out;
}

std::vector<NodeId> SimulationGraph::leaves() const
{
  std::vector<NodeId> out;
  for (const auto & n : nodes_) {
    if (n.is_leaf()) {
      out.push_back(n.id);
    }
  }
  return out;
}

std::vector<NodeId> SimulationGraph::path_to(NodeId id) const
{
  std::vector<NodeId> out;
  if (id >= nodes_.size()) {
    return out;
  }
  NodeId current = id;
  out.push_back(current);
  while (!nodes_[current].parent_ids.empty()) {
    current = nodes_[current].parent_ids.front();
    out.push_back(current);
  }
  std::reverse(out.begin(), out.end());
  return out;
}

GraphStatistics SimulationGraph::statistics() const
{
  GraphStatistics s;
  s.total_nodes = nodes_.size();
  std::map<uint32_t, size_t> widths;
  for (const auto & n : nodes_) {
    s.depth = std::max<size_t>(s.depth, n.layer);
    ++widths[n.layer];
    if (n.is_leaf()) {
      ++s.leaf_count;
    }
    if (n.children_ids.size() > 1) {
      ++s.branch_points;
    }
    if (n.is_merged()) {
      ++s.merged_nodes;
    }
    s.edge_count += n.parent_ids.size();
    if (n.status == NodeStatus::Ok) {
      ++s.successful;
    } else {
      ++s.failed;
    }
  }
  for (const auto & [layer, count] : widths) {
    s.max_width = std::max(s.max_width, count);
  }
  return s;
}

NodeId SimulationGraph::add_node(TreeNode node)
{
  const auto id = static_cast<NodeId>(nodes_.size());
  node.id = id;
  nodes_.push_back(std::move(node));
  return id;
}

void SimulationGraph::add_edge(NodeId child, IncomingEdge edge)
{
  const NodeId parent = edge.parent;
  TreeNode & c = nodes_.at(child);
  c.parent_ids.push_back(parent);
  c.incoming.push_back(std::move(edge));

  auto & siblings = nodes_.at(parent).children_ids;
  if (std::find(siblings.begin(), siblings.end(), child) == siblings.end()) {
    siblings.push_back(child);
  }
}

}  // namespace qualsim
