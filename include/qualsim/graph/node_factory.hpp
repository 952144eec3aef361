// qualsim/graph/node_factory.hpp - Node creation with per-layer merging
#pragma once

#include <string>
#include <unordered_map>

#include "qualsim/engine/transition.hpp"
#include "qualsim/graph/simulation_graph.hpp"

namespace qualsim
{

/**
 * Where a transition result ended up.
 */
struct Placement
{
  NodeId id = 0;
  bool merged = false;  ///< attached to an existing node of this layer
};

/**
 * Creates graph nodes from transition results.
 *
 * Within one layer, a result whose snapshot fingerprint and status match
 * an existing node is attached to that node as an additional parent edge
 * instead of creating a sibling. Nodes from earlier layers are never
 * merge targets.
 */
class NodeFactory
{
public:
  explicit NodeFactory(SimulationGraph & graph) : graph_(graph) {}

  NodeId create_root(WorldSnapshot snapshot);

  /// Starts a new layer; forgets every merge candidate of the previous one.
  void begin_layer();

  Placement create_or_merge(
    NodeId parent, const std::string & action_name, const ParameterMap & parameters,
    TransitionResult result);

  [[nodiscard]] uint32_t current_layer() const noexcept { return layer_; }
  [[nodiscard]] size_t merged_in_layer() const noexcept { return merged_in_layer_; }

  /// Merge key: snapshot fingerprint qualified by status.
  [[nodiscard]] static std::string merge_key(const WorldSnapshot & snapshot, NodeStatus status);

private:
  SimulationGraph & graph_;
  std::unordered_map<std::string, NodeId> layer_index_;
  uint32_t layer_ = 0;
  size_t merged_in_layer_ = 0;
};

}  // namespace qualsim
