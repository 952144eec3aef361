// qualsim/io/history.cpp - JSON export and compact history of a simulation graph
#include "qualsim/io/history.hpp"

#include <fmt/core.h>

#include <charconv>
#include <fstream>
#include <stdexcept>
#include <string_view>
#include <utility>

namespace qualsim
{

namespace
{

using json = nlohmann::json;

constexpr std::string_view k_format_name = "qualsim-history";

// ============================================================================
// Writing
// ============================================================================

json levels_to_json(const AttributeValue & value)
{
  json out = json::array();
  if (value.space != nullptr) {
    for (auto & name : value.space->names(value.levels)) {
      out.push_back(std::move(name));
    }
  }
  return out;
}

json value_to_json(const AttributeValue & value, bool with_space)
{
  json j;
  if (with_space && value.space != nullptr) {
    j["space"] = value.space->id();
  }
  j["levels"] = levels_to_json(value);
  j["trend"] = std::string(to_string(value.trend));
  return j;
}

json snapshot_to_json(const WorldSnapshot & snapshot)
{
  json j = json::object();
  for (const auto & [path, value] : snapshot.values()) {
    j[path.str()] = value_to_json(value, true);
  }
  return j;
}

json branch_condition_to_json(const BranchCondition & bc)
{
  json j;
  j["source"] = std::string(to_string(bc.source));
  j["branch_type"] = std::string(to_string(bc.branch_type));
  if (bc.is_compound()) {
    j["compound_type"] = std::string(to_string(*bc.compound_type));
    j["sub_conditions"] = json::array();
    for (const auto & sub : bc.sub_conditions) {
      j["sub_conditions"].push_back(branch_condition_to_json(sub));
    }
  } else {
    j["attribute"] = bc.attribute.str();
    j["operator"] = std::string(to_string(bc.op));
    j["values"] = bc.values;
  }
  j["description"] = bc.describe();
  return j;
}

json change_to_json(const Change & change)
{
  json j;
  j["attribute"] = change.attribute.str();
  j["kind"] = std::string(to_string(change.kind));
  j["before"] = value_to_json(change.before, false);
  j["after"] = value_to_json(change.after, false);
  return j;
}

json edge_to_json(const IncomingEdge & edge)
{
  json j;
  j["parent"] = node_name(edge.parent);
  j["parameters"] = edge.parameters;

  j["changes"] = json::array();
  for (const auto & c : edge.changes) {
    j["changes"].push_back(change_to_json(c));
  }

  j["branch_conditions"] = json::array();
  for (const auto & bc : edge.branch_path) {
    j["branch_conditions"].push_back(branch_condition_to_json(bc));
  }
  if (edge.branch_condition) {
    j["branch_condition"] = branch_condition_to_json(*edge.branch_condition);
  }

  if (!edge.violations.empty()) {
    j["violations"] = edge.violations;
  }
  if (!edge.undetermined_constraints.empty()) {
    j["undetermined_constraints"] = edge.undetermined_constraints;
  }
  if (edge.reason) {
    j["reason"] = *edge.reason;
  }
  if (edge.error) {
    json err;
    err["kind"] = std::string(to_string(edge.error->kind));
    err["message"] = edge.error->message;
    j["error"] = std::move(err);
  }
  return j;
}

json statistics_to_json(const GraphStatistics & s)
{
  json j;
  j["total_nodes"] = s.total_nodes;
  j["depth"] = s.depth;
  j["max_width"] = s.max_width;
  j["leaf_count"] = s.leaf_count;
  j["branch_points"] = s.branch_points;
  j["merged_nodes"] = s.merged_nodes;
  j["edge_count"] = s.edge_count;
  j["successful"] = s.successful;
  j["failed"] = s.failed;
  return j;
}

json header(const SimulationGraph & graph)
{
  json j;
  j["format"] = std::string(k_format_name);
  j["version"] = k_history_format_version;
  j["simulation_id"] = graph.simulation_id();
  j["object_type"] = graph.object_type();
  j["actions"] = graph.actions();
  return j;
}

json node_header(const TreeNode & node)
{
  json j;
  j["id"] = node.name();
  j["layer"] = node.layer;
  j["status"] = std::string(to_string(node.status));
  if (!node.action_name.empty()) {
    j["action"] = node.action_name;
  }
  return j;
}

// ============================================================================
// Reading
// ============================================================================

std::optional<NodeId> parse_node_name(std::string_view name)
{
  constexpr std::string_view prefix = "state";
  if (name.substr(0, prefix.size()) != prefix || name.size() == prefix.size()) {
    return std::nullopt;
  }
  NodeId id = 0;
  const char * first = name.data() + prefix.size();
  const char * last = name.data() + name.size();
  auto [ptr, ec] = std::from_chars(first, last, id);
  if (ec != std::errc{} || ptr != last) {
    return std::nullopt;
  }
  return id;
}

/// Throws std::runtime_error; replay_history turns it into a failed result.
[[noreturn]] void replay_error(const std::string & msg) { throw std::runtime_error(msg); }

AttributePath parse_path(const json & j)
{
  const auto text = j.get<std::string>();
  auto path = AttributePath::parse(text);
  if (!path) {
    replay_error(fmt::format("invalid attribute path '{}'", text));
  }
  return *path;
}

Trend parse_trend_json(const json & j)
{
  const auto text = j.get<std::string>();
  auto trend = parse_trend(text);
  if (!trend) {
    replay_error(fmt::format("invalid trend '{}'", text));
  }
  return *trend;
}

LevelSet parse_levels(const json & j, const QualitativeSpace & space)
{
  auto levels = space.resolve(j.get<std::vector<std::string>>());
  if (!levels) {
    replay_error(fmt::format("level list {} does not belong to space '{}'", j.dump(), space.id()));
  }
  return *levels;
}

WorldSnapshot parse_root(const json & values, const KnowledgeBase & kb)
{
  WorldSnapshot::ValueMap map;
  for (const auto & [key, v] : values.items()) {
    const auto path = AttributePath::parse(key);
    if (!path) {
      replay_error(fmt::format("invalid attribute path '{}'", key));
    }
    const auto space_id = v.at("space").get<std::string>();
    const QualitativeSpace * space = kb.find_space(space_id);
    if (space == nullptr) {
      replay_error(fmt::format("unknown space '{}' for '{}'", space_id, key));
    }
    map.emplace(*path, AttributeValue{space, parse_levels(v.at("levels"), *space),
                                      parse_trend_json(v.at("trend"))});
  }
  return WorldSnapshot(std::move(map), 0);
}

WorldSnapshot replay_edge(const WorldSnapshot & parent, const json & edge)
{
  WorldSnapshot snapshot = parent;
  for (const auto & c : edge.at("changes")) {
    Change change;
    change.attribute = parse_path(c.at("attribute"));
    const auto kind_text = c.at("kind").get<std::string>();
    const auto kind = parse_change_kind(kind_text);
    if (!kind) {
      replay_error(fmt::format("invalid change kind '{}'", kind_text));
    }
    change.kind = *kind;

    const AttributeValue * current = snapshot.find(change.attribute);
    if (current == nullptr || current->space == nullptr) {
      replay_error(fmt::format("change to unknown attribute '{}'", change.attribute.str()));
    }
    const json & after = c.at("after");
    change.before = *current;
    change.after = AttributeValue{
      current->space, parse_levels(after.at("levels"), *current->space),
      parse_trend_json(after.at("trend"))};
    snapshot = apply_change(snapshot, change);
  }
  return snapshot.with_sequence(parent.sequence() + 1);
}

}  // namespace

// ============================================================================
// Public API
// ============================================================================

nlohmann::json to_json(const SimulationGraph & graph)
{
  json out = header(graph);
  out["nodes"] = json::array();
  for (const auto & node : graph.nodes()) {
    json j = node_header(node);
    j["snapshot"] = snapshot_to_json(node.snapshot);
    j["parents"] = json::array();
    for (NodeId p : node.parent_ids) {
      j["parents"].push_back(node_name(p));
    }
    j["children"] = json::array();
    for (NodeId c : node.children_ids) {
      j["children"].push_back(node_name(c));
    }
    j["edges"] = json::array();
    for (const auto & edge : node.incoming) {
      j["edges"].push_back(edge_to_json(edge));
    }
    out["nodes"].push_back(std::move(j));
  }
  out["statistics"] = statistics_to_json(graph.statistics());
  return out;
}

nlohmann::json make_history(const SimulationGraph & graph)
{
  json out = header(graph);
  if (graph.empty()) {
    out["root"] = nullptr;
    out["nodes"] = json::array();
    return out;
  }

  json root;
  root["id"] = graph.root().name();
  root["values"] = snapshot_to_json(graph.root().snapshot);
  root["fingerprint"] = graph.root().snapshot.fingerprint();
  out["root"] = std::move(root);

  out["nodes"] = json::array();
  for (const auto & node : graph.nodes()) {
    if (node.is_root()) {
      continue;
    }
    json j = node_header(node);
    j["fingerprint"] = node.snapshot.fingerprint();
    j["edges"] = json::array();
    for (const auto & edge : node.incoming) {
      j["edges"].push_back(edge_to_json(edge));
    }
    out["nodes"].push_back(std::move(j));
  }
  out["statistics"] = statistics_to_json(graph.statistics());
  return out;
}

ReplayResult replay_history(const nlohmann::json & history, const KnowledgeBase & kb)
{
  ReplayResult result;
  try {
    if (history.value("format", std::string{}) != k_format_name) {
      return ReplayResult::fail("not a qualsim history document");
    }
    const int version = history.value("version", 0);
    if (version != k_history_format_version) {
      return ReplayResult::fail(fmt::format("unsupported history version {}", version));
    }
    const auto & root = history.at("root");
    if (root.is_null()) {
      return ReplayResult::fail("history has no root snapshot");
    }

    result.snapshots.push_back(parse_root(root.at("values"), kb));
    result.statuses.push_back(NodeStatus::Ok);
    result.actions.emplace_back();
    std::vector<bool> has_children(1, false);

    for (const auto & node : history.at("nodes")) {
      const auto name = node.at("id").get<std::string>();
      const auto id = parse_node_name(name);
      if (!id || *id != result.snapshots.size()) {
        return ReplayResult::fail(fmt::format("node '{}' is out of order", name));
      }
      const auto status_text = node.at("status").get<std::string>();
      const auto status = parse_node_status(status_text);
      if (!status) {
        return ReplayResult::fail(fmt::format("node '{}' has invalid status '{}'", name, status_text));
      }

      const auto & edges = node.at("edges");
      if (edges.empty()) {
        return ReplayResult::fail(fmt::format("node '{}' has no incoming edge", name));
      }

      std::optional<WorldSnapshot> rebuilt;
      for (const auto & edge : edges) {
        const auto parent_name = edge.at("parent").get<std::string>();
        const auto parent = parse_node_name(parent_name);
        if (!parent || *parent >= *id) {
          return ReplayResult::fail(
            fmt::format("node '{}' references parent '{}' that is not yet known", name, parent_name));
        }
        has_children[*parent] = true;

        WorldSnapshot snapshot = replay_edge(result.snapshots[*parent], edge);
        if (!rebuilt) {
          rebuilt = std::move(snapshot);
        } else if (!(snapshot == *rebuilt)) {
          return ReplayResult::fail(
            fmt::format("edges into '{}' disagree on the resulting snapshot", name));
        }
      }

      const auto fingerprint = node.value("fingerprint", std::string{});
      if (!fingerprint.empty() && rebuilt->fingerprint() != fingerprint) {
        return ReplayResult::fail(fmt::format("snapshot of '{}' does not match its fingerprint", name));
      }

      result.snapshots.push_back(std::move(*rebuilt));
      result.statuses.push_back(*status);
      result.actions.push_back(node.value("action", std::string{}));
      has_children.push_back(false);
    }

    for (NodeId id = 0; id < has_children.size(); ++id) {
      if (!has_children[id]) {
        result.leaves.push_back(id);
      }
    }
  } catch (const nlohmann::json::exception & e) {
    return ReplayResult::fail(fmt::format("malformed history: {}", e.what()));
  } catch (const std::runtime_error & e) {
    return ReplayResult::fail(e.what());
  }

  result.success = true;
  return result;
}

HistoryReadResult read_history_file(const std::filesystem::path & path)
{
  HistoryReadResult result;
  std::ifstream in(path);
  if (!in) {
    result.error = fmt::format("cannot open '{}'", path.string());
    return result;
  }
  try {
    in >> result.history;
  } catch (const nlohmann::json::parse_error & e) {
    result.error = fmt::format("failed to parse '{}': {}", path.string(), e.what());
    return result;
  }
  result.success = true;
  return result;
}

std::optional<std::string> write_history_file(
  const std::filesystem::path & path, const nlohmann::json & history)
{
  std::error_code ec;
  if (path.has_parent_path()) {
    std::filesystem::create_directories(path.parent_path(), ec);
    if (ec) {
      return fmt::format("cannot create '{}': {}", path.parent_path().string(), ec.message());
    }
  }
  std::ofstream out(path);
  if (!out) {
    return fmt::format("cannot write '{}'", path.string());
  }
  out << history.dump(2) << '\n';
  if (!out) {
    return fmt::format("failed while writing '{}'", path.string());
  }
  return std::nullopt;
}

}  // namespace qualsim
