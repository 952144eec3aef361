// tests/unit/io/test_history.cpp - Graph export, compact history and replay
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <string>
#include <vector>

#include "qualsim/graph/tree_runner.hpp"
#include "qualsim/io/history.hpp"
#include "qualsim/test_support/flashlight_kb.hpp"

using namespace qualsim;
using json = nlohmann::json;

namespace fs = std::filesystem;

namespace
{

std::vector<std::string> strings(const json & j) { return j.get<std::vector<std::string>>(); }

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

class IoHistory : public ::testing::Test
{
protected:
  void SetUp() override { kb_ = test_support::make_flashlight_kb(); }

  RunResult run(std::string_view text, const RunOptions & options = {}) const
  {
    const auto requests = parse_action_requests(text);
    EXPECT_TRUE(requests.has_value());
    return TreeRunner(kb_).run("flashlight", *requests, options);
  }

  RunResult run_merging() const
  {
    RunOptions options;
    options.simulation_id = "merge";
    options.initial_values["battery.level"] = {"high", "full"};
    return run("turn_on,replace_battery", options);
  }

  KnowledgeBase kb_;
};

}  // namespace

TEST_F(IoHistory, CompactHistoryLayout)
{
  const RunResult r = run("turn_on");
  const json h = make_history(r.graph);

  EXPECT_EQ(h["format"].get<std::string>(), "qualsim-history");
  EXPECT_EQ(h["version"].get<int>(), k_history_format_version);
  EXPECT_EQ(h["simulation_id"].get<std::string>(), "simulation");
  EXPECT_EQ(h["object_type"].get<std::string>(), "flashlight");
  EXPECT_EQ(strings(h["actions"]), (std::vector<std::string>{"turn_on"}));

  EXPECT_EQ(h["root"]["id"].get<std::string>(), "state0");
  EXPECT_EQ(h["root"]["values"]["battery.level"]["space"].get<std::string>(), "battery_level");
  EXPECT_EQ(h["root"]["values"]["battery.level"]["levels"].size(), 5U);
  EXPECT_EQ(strings(h["root"]["values"]["model"]["levels"]), (std::vector<std::string>{"standard"}));

  ASSERT_EQ(h["nodes"].size(), 4U);
  const json & first = h["nodes"][0];
  EXPECT_EQ(first["id"].get<std::string>(), "state1");
  EXPECT_EQ(first["layer"].get<int>(), 1);
  EXPECT_EQ(first["action"].get<std::string>(), "turn_on");
  EXPECT_EQ(first["status"].get<std::string>(), "ok");
  ASSERT_EQ(first["edges"].size(), 1U);
  EXPECT_EQ(first["edges"][0]["parent"].get<std::string>(), "state0");
  EXPECT_EQ(first["edges"][0]["branch_conditions"].size(), 2U);
  EXPECT_EQ(first["edges"][0]["branch_condition"]["branch_type"].get<std::string>(), "if");
  EXPECT_EQ(first["edges"][0]["branch_condition"]["source"].get<std::string>(), "postcondition");

  const json & rejected = h["nodes"][3];
  EXPECT_EQ(rejected["status"].get<std::string>(), "rejected");
  EXPECT_EQ(rejected["edges"][0]["reason"].get<std::string>(), "precondition not met: battery.level != empty");
  EXPECT_EQ(rejected["edges"][0]["branch_condition"]["branch_type"].get<std::string>(), "fail");
  EXPECT_EQ(rejected["edges"][0]["branch_condition"]["operator"].get<std::string>(), "not_equals");
  EXPECT_EQ(strings(rejected["edges"][0]["branch_condition"]["values"]), (std::vector<std::string>{"empty"}));

  EXPECT_EQ(h["statistics"]["total_nodes"].get<int>(), 5);
}

TEST_F(IoHistory, ChangesAreOrdered)
{
  const RunResult r = run("turn_on");
  const json h = make_history(r.graph);
  const json & changes = h["nodes"][0]["edges"][0]["changes"];

  // narrowing by the precondition, two writes, narrowing by the if, brightness, trend
  ASSERT_EQ(changes.size(), 6U);
  EXPECT_EQ(changes[0]["kind"].get<std::string>(), "narrowing");
  EXPECT_EQ(changes[0]["attribute"].get<std::string>(), "battery.level");
  EXPECT_EQ(strings(changes[0]["after"]["levels"]), (std::vector<std::string>{"low", "medium", "high", "full"}));
  EXPECT_EQ(changes[1]["attribute"].get<std::string>(), "switch.position");
  EXPECT_EQ(changes[2]["attribute"].get<std::string>(), "bulb.state");
  EXPECT_EQ(changes[3]["kind"].get<std::string>(), "narrowing");
  EXPECT_EQ(strings(changes[3]["after"]["levels"]), (std::vector<std::string>{"full"}));
  EXPECT_EQ(changes[4]["attribute"].get<std::string>(), "bulb.brightness");
  EXPECT_EQ(changes[5]["kind"].get<std::string>(), "trend");
  EXPECT_EQ(changes[5]["after"]["trend"].get<std::string>(), "down");
}

TEST_F(IoHistory, ReplayRebuildsEverySnapshot)
{
  const RunResult r = run("turn_on,set_brightness:level=low,turn_off,replace_battery,turn_on");
  ASSERT_TRUE(r.success);
  const ReplayResult replay = replay_history(make_history(r.graph), kb_);
  ASSERT_TRUE(replay.success) << replay.error;

  ASSERT_EQ(replay.snapshots.size(), r.graph.size());
  for (NodeId id = 0; id < r.graph.size(); ++id) {
    EXPECT_TRUE(replay.snapshots[id] == r.graph.node(id).snapshot) << node_name(id);
    EXPECT_EQ(replay.statuses[id], r.graph.node(id).status);
    EXPECT_EQ(replay.actions[id], r.graph.node(id).action_name);
  }
  EXPECT_EQ(replay.leaves, r.graph.leaves());
}

TEST_F(IoHistory, ReplayChecksEveryEdgeOfMergedNodes)
{
  const RunResult r = run_merging();
  ASSERT_TRUE(r.graph.node(3).is_merged());
  const json h = make_history(r.graph);

  const ReplayResult ok = replay_history(h, kb_);
  ASSERT_TRUE(ok.success) << ok.error;
  EXPECT_TRUE(ok.snapshots[3] == r.graph.node(3).snapshot);

  json tampered = h;
  json & second_edge = tampered["nodes"][2]["edges"][1];
  ASSERT_EQ(second_edge["parent"].get<std::string>(), "state2");
  second_edge["changes"][0]["after"]["levels"] = json::array({"high"});
  const ReplayResult bad = replay_history(tampered, kb_);
  EXPECT_FALSE(bad.success);
  EXPECT_NE(bad.error.find("disagree"), std::string::npos);
}

TEST_F(IoHistory, ReplayDetectsFingerprintMismatch)
{
  json h = make_history(run("turn_on").graph);
  h["nodes"][1]["edges"][0]["changes"][4]["after"]["levels"] = json::array({"low"});
  const ReplayResult r = replay_history(h, kb_);
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("state2"), std::string::npos);
}

TEST_F(IoHistory, ReplayRejectsMalformedDocuments)
{
  const json h = make_history(run("turn_on").graph);

  json wrong_format = h;
  wrong_format["format"] = "something-else";
  EXPECT_FALSE(replay_history(wrong_format, kb_).success);

  json wrong_version = h;
  wrong_version["version"] = k_history_format_version + 1;
  EXPECT_FALSE(replay_history(wrong_version, kb_).success);

  json out_of_order = h;
  std::swap(out_of_order["nodes"][0], out_of_order["nodes"][1]);
  EXPECT_FALSE(replay_history(out_of_order, kb_).success);

  json bad_level = h;
  bad_level["root"]["values"]["bulb.state"]["levels"] = json::array({"dim"});
  EXPECT_FALSE(replay_history(bad_level, kb_).success);

  json missing_field = h;
  missing_field["nodes"][0].erase("edges");
  const ReplayResult r = replay_history(missing_field, kb_);
  EXPECT_FALSE(r.success);
  EXPECT_FALSE(r.error.empty());

  EXPECT_FALSE(replay_history(make_history(SimulationGraph{}), kb_).success);
}

TEST_F(IoHistory, FullExportListsSnapshotsAndLinks)
{
  const RunResult r = run_merging();
  const json j = to_json(r.graph);
  ASSERT_EQ(j["nodes"].size(), 4U);
  EXPECT_EQ(strings(j["nodes"][0]["children"]), (std::vector<std::string>{"state1", "state2"}));
  EXPECT_EQ(strings(j["nodes"][3]["parents"]), (std::vector<std::string>{"state1", "state2"}));
  EXPECT_EQ(j["nodes"][3]["edges"].size(), 2U);
  EXPECT_EQ(strings(j["nodes"][3]["snapshot"]["battery.level"]["levels"]), (std::vector<std::string>{"full"}));
  EXPECT_EQ(j["statistics"]["merged_nodes"].get<int>(), 1);
}

TEST_F(IoHistory, FileRoundTrip)
{
  const fs::path dir = make_temp_dir("qualsim_history");
  const fs::path file = dir / "nested" / "run.json";
  const json h = make_history(run("turn_on").graph);

  const auto err = write_history_file(file, h);
  ASSERT_FALSE(err.has_value()) << *err;
  const HistoryReadResult read = read_history_file(file);
  ASSERT_TRUE(read.success) << read.error;
  EXPECT_EQ(read.history.dump(), h.dump());
  EXPECT_TRUE(replay_history(read.history, kb_).success);

  EXPECT_FALSE(read_history_file(dir / "missing.json").success);
  fs::remove_all(dir);
}
