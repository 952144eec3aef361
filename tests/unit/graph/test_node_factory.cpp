// tests/unit/graph/test_node_factory.cpp - Node creation and per-layer merging
//
#include <gtest/gtest.h>

#include "qualsim/graph/node_factory.hpp"
#include "qualsim/test_support/flashlight_kb.hpp"

using namespace qualsim;

namespace
{

const AttributePath k_level{"battery", "level"};

class GraphNodeFactory : public ::testing::Test
{
protected:
  void SetUp() override
  {
    kb_ = test_support::make_flashlight_kb();
    root_ = kb_.find_object_type("flashlight")->default_snapshot();
  }

  TransitionResult result(NodeStatus status, const WorldSnapshot & after) const
  {
    TransitionResult r;
    r.status = status;
    r.before = root_;
    r.branch_state = after;
    if (status == NodeStatus::Ok) {
      r.after = after;
    }
    return r;
  }

  KnowledgeBase kb_;
  WorldSnapshot root_;
};

}  // namespace

TEST_F(GraphNodeFactory, RootIsLayerZero)
{
  SimulationGraph graph("sim", "flashlight");
  NodeFactory factory(graph);
  const NodeId root = factory.create_root(root_);
  EXPECT_EQ(root, 0U);
  EXPECT_EQ(graph.root().name(), "state0");
  EXPECT_EQ(graph.root().layer, 0U);
  EXPECT_TRUE(graph.root().is_root());
}

TEST_F(GraphNodeFactory, IdenticalSiblingsMerge)
{
  SimulationGraph graph("sim", "flashlight");
  NodeFactory factory(graph);
  const NodeId root = factory.create_root(root_);
  factory.begin_layer();

  const WorldSnapshot full = root_.with_levels(k_level, LevelSet::single(4)).with_sequence(1);
  const Placement a = factory.create_or_merge(root, "replace_battery", {}, result(NodeStatus::Ok, full));
  const Placement b = factory.create_or_merge(root, "replace_battery", {}, result(NodeStatus::Ok, full));

  EXPECT_FALSE(a.merged);
  EXPECT_TRUE(b.merged);
  EXPECT_EQ(a.id, b.id);
  EXPECT_EQ(graph.size(), 2U);
  EXPECT_EQ(factory.merged_in_layer(), 1U);

  const TreeNode & node = graph.node(a.id);
  EXPECT_EQ(node.parent_ids.size(), 2U);
  EXPECT_EQ(node.incoming.size(), 2U);
  EXPECT_TRUE(node.is_merged());
  // the root lists the merged child once
  EXPECT_EQ(graph.root().children_ids.size(), 1U);
}

TEST_F(GraphNodeFactory, StatusIsPartOfTheKey)
{
  SimulationGraph graph("sim", "flashlight");
  NodeFactory factory(graph);
  const NodeId root = factory.create_root(root_);
  factory.begin_layer();

  const WorldSnapshot s = root_.with_sequence(1);
  const Placement a = factory.create_or_merge(root, "x", {}, result(NodeStatus::Ok, s));
  const Placement b = factory.create_or_merge(root, "x", {}, result(NodeStatus::Rejected, s));
  EXPECT_FALSE(b.merged);
  EXPECT_NE(a.id, b.id);
  EXPECT_NE(NodeFactory::merge_key(s, NodeStatus::Ok), NodeFactory::merge_key(s, NodeStatus::Rejected));
  EXPECT_EQ(NodeFactory::merge_key(s, NodeStatus::Ok), s.fingerprint() + "#ok");
}

TEST_F(GraphNodeFactory, EarlierLayersAreNotMergeTargets)
{
  SimulationGraph graph("sim", "flashlight");
  NodeFactory factory(graph);
  const NodeId root = factory.create_root(root_);

  factory.begin_layer();
  const Placement first = factory.create_or_merge(root, "x", {}, result(NodeStatus::Ok, root_));
  EXPECT_EQ(factory.current_layer(), 1U);

  factory.begin_layer();
  const Placement second = factory.create_or_merge(first.id, "x", {}, result(NodeStatus::Ok, root_));
  EXPECT_FALSE(second.merged);
  EXPECT_EQ(graph.node(second.id).layer, 2U);
  EXPECT_EQ(factory.merged_in_layer(), 0U);
}

TEST_F(GraphNodeFactory, EdgeCarriesLastDecision)
{
  SimulationGraph graph("sim", "flashlight");
  NodeFactory factory(graph);
  const NodeId root = factory.create_root(root_);
  factory.begin_layer();

  TransitionResult r = result(NodeStatus::Rejected, root_);
  BranchCondition first;
  first.branch_type = BranchType::Success;
  BranchCondition last;
  last.branch_type = BranchType::Else;
  last.source = ConditionSource::Postcondition;
  r.branch_conditions = {first, last};
  r.reason = "precondition not met: x";

  const Placement p = factory.create_or_merge(root, "x", {{"k", "v"}}, std::move(r));
  const IncomingEdge * edge = graph.node(p.id).primary_edge();
  ASSERT_NE(edge, nullptr);
  ASSERT_TRUE(edge->branch_condition.has_value());
  EXPECT_EQ(edge->branch_condition->branch_type, BranchType::Else);
  EXPECT_EQ(edge->branch_path.size(), 2U);
  EXPECT_EQ(edge->parameters.at("k"), "v");
  EXPECT_EQ(*edge->reason, "precondition not met: x");
  EXPECT_EQ(graph.node(p.id).status, NodeStatus::Rejected);
  EXPECT_EQ(graph.node(p.id).action_name, "x");
}
