// qualsim/graph/tree_runner.hpp - Layer-by-layer simulation of an action sequence
#pragma once

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "qualsim/engine/transition.hpp"
#include "qualsim/graph/simulation_graph.hpp"
#include "qualsim/model/action.hpp"
#include "qualsim/model/knowledge_base.hpp"

namespace qualsim
{

struct ActionRequest
{
  std::string name;
  ParameterMap parameters;

  [[nodiscard]] std::string describe() const;
};

/**
 * Parses a comma separated request list such as
 * "turn_on,set_mode:mode=high,level=low,turn_off".
 *
 * A token holding "=" but no ":" adds a parameter to the preceding action.
 * Returns std::nullopt on empty names or a dangling parameter.
 */
[[nodiscard]] std::optional<std::vector<ActionRequest>> parse_action_requests(std::string_view text);

/**
 * Progress callbacks. Invoked on the calling thread, in commit order.
 */
class RunObserver
{
public:
  virtual ~RunObserver() = default;

  virtual void on_layer_begin(size_t /*index*/, const ActionRequest & /*request*/, size_t /*frontier*/) {}
  virtual void on_node(const TreeNode & /*node*/, bool /*merged*/) {}
  virtual void on_layer_end(size_t /*index*/, size_t /*created*/, size_t /*merged*/) {}
};

struct RunOptions
{
  std::string simulation_id = "simulation";
  /// "part.attr" -> levels ("unknown" alone means the whole space).
  std::map<std::string, std::vector<std::string>> initial_values;
  unsigned jobs = 1;
  RunObserver * observer = nullptr;
};

struct RunResult
{
  SimulationGraph graph;
  bool success = false;
  std::optional<TransitionError> error;
  /// Index of the request whose layer stopped the run, if one did.
  std::optional<size_t> halted_at;
};

/**
 * Expands a simulation graph one action per layer.
 *
 * Every Ok node of the current layer is a leaf to expand. Transitions for
 * the leaves are computed on up to `jobs` threads and committed in leaf
 * order, so node ids and merges do not depend on `jobs`. Rejected,
 * constraint-violating and error nodes are never expanded. A halting
 * error stops the run once its layer is committed.
 */
class TreeRunner
{
public:
  explicit TreeRunner(const KnowledgeBase & kb) : kb_(kb) {}

  [[nodiscard]] RunResult run(
    std::string_view object_type, const std::vector<ActionRequest> & requests,
    const RunOptions & options = {}) const;

private:
  const KnowledgeBase & kb_;
};

}  // namespace qualsim
