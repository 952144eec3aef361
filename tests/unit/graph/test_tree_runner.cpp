// tests/unit/graph/test_tree_runner.cpp - Layered runs over the flashlight model
//
#include <gtest/gtest.h>

#include <vector>

#include "qualsim/graph/tree_runner.hpp"
#include "qualsim/test_support/flashlight_kb.hpp"

using namespace qualsim;

namespace
{

const AttributePath k_level{"battery", "level"};

std::vector<ActionRequest> requests(std::string_view text)
{
  auto parsed = parse_action_requests(text);
  EXPECT_TRUE(parsed.has_value()) << text;
  return parsed.value_or(std::vector<ActionRequest>{});
}

class CountingObserver : public RunObserver
{
public:
  void on_layer_begin(size_t, const ActionRequest &, size_t) override { ++layers; }
  void on_node(const TreeNode &, bool merged) override
  {
    ++nodes;
    if (merged) {
      ++merges;
    }
  }
  void on_layer_end(size_t, size_t, size_t merged) override { reported_merges += merged; }

  size_t layers = 0;
  size_t nodes = 0;
  size_t merges = 0;
  size_t reported_merges = 0;
};

}  // namespace

// ============================================================================
// Request parsing
// ============================================================================

TEST(GraphActionRequests, ParsesNamesAndParameters)
{
  const auto parsed = parse_action_requests("turn_on,set_brightness:level=high,turn_off");
  ASSERT_TRUE(parsed.has_value());
  ASSERT_EQ(parsed->size(), 3U);
  EXPECT_EQ((*parsed)[0].name, "turn_on");
  EXPECT_TRUE((*parsed)[0].parameters.empty());
  EXPECT_EQ((*parsed)[1].parameters.at("level"), "high");
  EXPECT_EQ((*parsed)[1].describe(), "set_brightness:level=high");
  EXPECT_EQ((*parsed)[2].describe(), "turn_off");
}

TEST(GraphActionRequests, BareParameterContinuesPreviousAction)
{
  const auto parsed = parse_action_requests("a:k=v,k2=v2,b");
  ASSERT_TRUE(parsed.has_value());
  ASSERT_EQ(parsed->size(), 2U);
  EXPECT_EQ((*parsed)[0].parameters.size(), 2U);
  EXPECT_EQ((*parsed)[0].parameters.at("k2"), "v2");
  EXPECT_EQ((*parsed)[1].name, "b");
}

TEST(GraphActionRequests, RejectsMalformedInput)
{
  EXPECT_FALSE(parse_action_requests("").has_value());
  EXPECT_FALSE(parse_action_requests("a,,b").has_value());
  EXPECT_FALSE(parse_action_requests("k=v").has_value());
  EXPECT_FALSE(parse_action_requests("a:=v").has_value());
  EXPECT_FALSE(parse_action_requests(":k=v").has_value());
}

// ============================================================================
// Runs
// ============================================================================

TEST(GraphTreeRunner, TurnOnFromUnknownBattery)
{
  const auto kb = test_support::make_flashlight_kb();
  const TreeRunner runner(kb);
  const RunResult result = runner.run("flashlight", requests("turn_on"));

  ASSERT_TRUE(result.success);
  const SimulationGraph & g = result.graph;
  ASSERT_EQ(g.size(), 5U);
  EXPECT_EQ(g.actions(), (std::vector<std::string>{"turn_on"}));
  EXPECT_EQ(g.root().children_ids, (std::vector<NodeId>{1, 2, 3, 4}));

  EXPECT_EQ(g.node(1).status, NodeStatus::Ok);
  EXPECT_EQ(g.node(2).status, NodeStatus::Ok);
  EXPECT_EQ(g.node(3).status, NodeStatus::Ok);
  EXPECT_EQ(g.node(4).status, NodeStatus::Rejected);
  EXPECT_EQ(g.node(1).snapshot.find(k_level)->describe(), "full (down)");
  EXPECT_EQ(g.node(3).snapshot.find(k_level)->describe(), "{low, medium} (down)");
  EXPECT_EQ(g.node(4).snapshot.find(k_level)->describe(), "empty");
  EXPECT_EQ(g.node(2).action_name, "turn_on");
  EXPECT_EQ(g.node(2).snapshot.sequence(), 1U);

  const GraphStatistics s = g.statistics();
  EXPECT_EQ(s.total_nodes, 5U);
  EXPECT_EQ(s.depth, 1U);
  EXPECT_EQ(s.max_width, 4U);
  EXPECT_EQ(s.leaf_count, 4U);
  EXPECT_EQ(s.branch_points, 1U);
  EXPECT_EQ(s.merged_nodes, 0U);
  EXPECT_EQ(s.edge_count, 4U);
  EXPECT_EQ(s.successful, 4U);
  EXPECT_EQ(s.failed, 1U);
}

TEST(GraphTreeRunner, ConvergingBranchesMerge)
{
  const auto kb = test_support::make_flashlight_kb();
  const TreeRunner runner(kb);
  RunOptions options;
  options.initial_values["battery.level"] = {"high", "full"};

  const RunResult result = runner.run("flashlight", requests("turn_on,replace_battery"), options);
  ASSERT_TRUE(result.success);
  const SimulationGraph & g = result.graph;

  // root, two lit states, one merged replacement
  ASSERT_EQ(g.size(), 4U);
  const TreeNode & merged = g.node(3);
  EXPECT_EQ(merged.layer, 2U);
  EXPECT_EQ(merged.parent_ids, (std::vector<NodeId>{1, 2}));
  EXPECT_TRUE(merged.is_merged());
  EXPECT_EQ(merged.snapshot.find(k_level)->describe(), "full");

  ASSERT_EQ(merged.incoming.size(), 2U);
  // from {full}: the materialised value folds back onto itself, only the trend changes
  ASSERT_EQ(merged.incoming[0].changes.size(), 1U);
  EXPECT_EQ(merged.incoming[0].changes[0].kind, ChangeKind::Trend);
  ASSERT_EQ(merged.incoming[1].changes.size(), 2U);
  EXPECT_EQ(merged.incoming[1].changes[0].kind, ChangeKind::Value);
  EXPECT_EQ(merged.incoming[1].changes[0].before.levels, LevelSet::single(3));
  EXPECT_EQ(merged.incoming[1].changes[0].after.levels, LevelSet::single(4));

  EXPECT_EQ(g.statistics().merged_nodes, 1U);
  EXPECT_EQ(g.path_to(3), (std::vector<NodeId>{0, 1, 3}));
}

TEST(GraphTreeRunner, OnlyOkNodesAreExpanded)
{
  const auto kb = test_support::make_flashlight_kb();
  const TreeRunner runner(kb);
  const RunResult result = runner.run("flashlight", requests("turn_on,turn_off"));
  ASSERT_TRUE(result.success);
  const SimulationGraph & g = result.graph;

  EXPECT_TRUE(g.node(4).is_leaf());
  EXPECT_EQ(g.layer(2).size(), 3U);
  for (NodeId id : g.layer(2)) {
    EXPECT_EQ(g.node(id).status, NodeStatus::Ok);
    EXPECT_EQ(g.node(id).snapshot.find(k_level)->trend, Trend::None);
  }
}

TEST(GraphTreeRunner, HaltingErrorStopsAfterItsLayer)
{
  const auto kb = test_support::make_flashlight_kb();
  const TreeRunner runner(kb);
  const RunResult result = runner.run("flashlight", requests("break_model,turn_on"));

  EXPECT_FALSE(result.success);
  ASSERT_TRUE(result.error.has_value());
  EXPECT_EQ(result.error->kind, ErrorKind::ImmutableWrite);
  ASSERT_TRUE(result.halted_at.has_value());
  EXPECT_EQ(*result.halted_at, 0U);
  EXPECT_EQ(result.graph.size(), 2U);
  EXPECT_EQ(result.graph.node(1).status, NodeStatus::Error);
}

TEST(GraphTreeRunner, UnknownActionHalts)
{
  const auto kb = test_support::make_flashlight_kb();
  const TreeRunner runner(kb);
  const RunResult result = runner.run("flashlight", requests("fly"));
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::UnknownAction);
  EXPECT_EQ(result.graph.size(), 2U);
}

TEST(GraphTreeRunner, SetupErrors)
{
  const auto kb = test_support::make_flashlight_kb();
  const TreeRunner runner(kb);

  RunResult result = runner.run("lantern", requests("turn_on"));
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.graph.empty());
  EXPECT_FALSE(result.halted_at.has_value());

  RunOptions options;
  options.initial_values["bulb.colour"] = {"red"};
  result = runner.run("flashlight", requests("turn_on"), options);
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error->kind, ErrorKind::Domain);

  options.initial_values.clear();
  options.initial_values["bulb.state"] = {"dim"};
  result = runner.run("flashlight", requests("turn_on"), options);
  EXPECT_EQ(result.error->kind, ErrorKind::UnknownLevel);
}

TEST(GraphTreeRunner, ParallelRunMatchesSequential)
{
  const auto kb = test_support::make_flashlight_kb();
  const TreeRunner runner(kb);
  const auto seq = requests("turn_on,turn_off,replace_battery,turn_on,set_brightness:level=low");

  RunOptions one;
  RunOptions many;
  many.jobs = 4;
  const RunResult a = runner.run("flashlight", seq, one);
  const RunResult b = runner.run("flashlight", seq, many);

  ASSERT_EQ(a.graph.size(), b.graph.size());
  for (NodeId id = 0; id < a.graph.size(); ++id) {
    EXPECT_EQ(a.graph.node(id).snapshot.fingerprint(), b.graph.node(id).snapshot.fingerprint());
    EXPECT_EQ(a.graph.node(id).status, b.graph.node(id).status);
    EXPECT_EQ(a.graph.node(id).parent_ids, b.graph.node(id).parent_ids);
  }
}

TEST(GraphTreeRunner, ObserverSeesEveryPlacement)
{
  const auto kb = test_support::make_flashlight_kb();
  const TreeRunner runner(kb);
  CountingObserver observer;
  RunOptions options;
  options.initial_values["battery.level"] = {"high", "full"};
  options.observer = &observer;

  const RunResult result = runner.run("flashlight", requests("turn_on,replace_battery"), options);
  ASSERT_TRUE(result.success);
  EXPECT_EQ(observer.layers, 2U);
  EXPECT_EQ(observer.nodes, 4U);
  EXPECT_EQ(observer.merges, 1U);
  EXPECT_EQ(observer.reported_merges, 1U);
}
