// qualsim/graph/tree_runner.cpp
#include "qualsim/graph/tree_runner.hpp"

#include <fmt/core.h>

#include <algorithm>
#include <thread>
#include <utility>

#include "qualsim/engine/transition_engine.hpp"
#include "qualsim/graph/node_factory.hpp"

namespace qualsim
{

namespace
{

std::string_view trim(std::string_view s)
{
  while (!s.empty() && (s.front() == ' ' || s.front() == '\t')) {
    s.remove_prefix(1);
  }
  while (!s.empty() && (s.back() == ' ' || s.back() == '\t')) {
    s.remove_suffix(1);
  }
  return s;
}

bool add_parameter(ActionRequest & request, std::string_view token)
{
  const size_t eq = token.find('=');
  const std::string_view key = trim(token.substr(0, eq));
  if (eq == std::string_view::npos || key.empty()) {
    return false;
  }
  request.parameters[std::string(key)] = std::string(trim(token.substr(eq + 1)));
  return true;
}

/// Applies --set style overrides to the default snapshot.
std::optional<TransitionError> apply_initial_values(
  WorldSnapshot & snapshot, const std::map<std::string, std::vector<std::string>> & values)
{
  for (const auto & [text, levels] : values) {
    const auto path = AttributePath::parse(text);
    const AttributeValue * current = path ? snapshot.find(*path) : nullptr;
    if (current == nullptr) {
      return TransitionError{
        ErrorKind::Domain, fmt::format("initial value for unknown attribute '{}'", text)};
    }
    if (levels.size() == 1 && levels.front() == "unknown") {
      snapshot = snapshot.with_levels(*path, current->space->all());
      continue;
    }
    const auto set = current->space->resolve(levels);
    if (!set || set->empty()) {
      return TransitionError{
        ErrorKind::UnknownLevel,
        fmt::format("initial value for '{}' is not a level of space '{}'", text,
                    current->space->id())};
    }
    snapshot = snapshot.with_levels(*path, *set);
  }
  return std::nullopt;
}

TransitionResult unknown_action(const WorldSnapshot & before, const std::string & name, std::string_view type)
{
  TransitionResult r;
  r.status = NodeStatus::Error;
  r.before = before;
  r.branch_state = before.with_sequence(before.sequence() + 1);
  r.error = TransitionError{
    ErrorKind::UnknownAction, fmt::format("no action '{}' for object type '{}'", name, type)};
  return r;
}

}  // namespace

std::string ActionRequest::describe() const
{
  if (parameters.empty()) {
    return name;
  }
  std::string out = name + ":";
  bool first = true;
  for (const auto & [k, v] : parameters) {
    out += fmt::format("{}{}={}", first ? "" : ",", k, v);
    first = false;
  }
  return out;
}

std::optional<std::vector<ActionRequest>> parse_action_requests(std::string_view text)
{
  std::vector<ActionRequest> out;
  size_t pos = 0;
  while (pos <= text.size()) {
    size_t comma = text.find(',', pos);
    if (comma == std::string_view::npos) {
      comma = text.size();
    }
    const std::string_view token = trim(text.substr(pos, comma - pos));
    pos = comma + 1;

    const size_t colon = token.find(':');
    if (colon == std::string_view::npos && token.find('=') != std::string_view::npos) {
      if (out.empty() || !add_parameter(out.back(), token)) {
        return std::nullopt;
      }
      continue;
    }

    ActionRequest request;
    request.name = std::string(trim(token.substr(0, colon)));
    if (request.name.empty()) {
      return std::nullopt;
    }
    if (colon != std::string_view::npos && !add_parameter(request, token.substr(colon + 1))) {
      return std::nullopt;
    }
    out.push_back(std::move(request));
  }
  return out;
}

RunResult TreeRunner::run(
  std::string_view object_type, const std::vector<ActionRequest> & requests,
  const RunOptions & options) const
{
  RunResult result;
  result.graph = SimulationGraph(options.simulation_id, std::string(object_type));

  const ObjectType * type = kb_.find_object_type(object_type);
  if (type == nullptr) {
    result.error =
      TransitionError{ErrorKind::Validation, fmt::format("unknown object type '{}'", object_type)};
    return result;
  }

  WorldSnapshot initial = type->default_snapshot();
  if (auto err = apply_initial_values(initial, options.initial_values)) {
    result.error = std::move(err);
    return result;
  }

  SimulationGraph & graph = result.graph;
  NodeFactory factory(graph);
  const TransitionEngine engine(*type);
  std::vector<NodeId> frontier{factory.create_root(std::move(initial))};

  for (size_t index = 0; index < requests.size() && !frontier.empty(); ++index) {
    const ActionRequest & request = requests[index];
    graph.append_action(request.name);
    factory.begin_layer();
    if (options.observer != nullptr) {
      options.observer->on_layer_begin(index, request, frontier.size());
    }

    // === Compute (parallel, read-only on the graph) ===
    std::vector<std::vector<TransitionResult>> batches(frontier.size());
    const std::optional<Action> action = kb_.resolve_action(object_type, request.name);
    auto expand = [&](size_t k) {
      const WorldSnapshot & before = graph.node(frontier[k]).snapshot;
      if (!action) {
        batches[k].push_back(unknown_action(before, request.name, object_type));
      } else {
        batches[k] = engine.apply(before, *action, request.parameters);
      }
    };

    const size_t workers = std::min<size_t>(std::max(1U, options.jobs), frontier.size());
    if (workers <= 1) {
      for (size_t k = 0; k < frontier.size(); ++k) {
        expand(k);
      }
    } else {
      std::vector<std::thread> threads;
      threads.reserve(workers);
      for (size_t w = 0; w < workers; ++w) {
        threads.emplace_back([&expand, &frontier, w, workers] {
          for (size_t k = w; k < frontier.size(); k += workers) {
            expand(k);
          }
        });
      }
      for (auto & t : threads) {
        t.join();
      }
    }

    // === Commit (sequential, leaf order) ===
    std::vector<NodeId> next;
    size_t created = 0;
    for (size_t k = 0; k < frontier.size(); ++k) {
      for (auto & r : batches[k]) {
        if (r.halts_run() && !result.error) {
          result.error = r.error;
          result.halted_at = index;
        }
        const Placement placed =
          factory.create_or_merge(frontier[k], request.name, request.parameters, std::move(r));
        if (!placed.merged) {
          ++created;
        }
        const TreeNode & node = graph.node(placed.id);
        if (options.observer != nullptr) {
          options.observer->on_node(node, placed.merged);
        }
        if (node.status == NodeStatus::Ok &&
            std::find(next.begin(), next.end(), placed.id) == next.end()) {
          next.push_back(placed.id);
        }
      }
    }

    if (options.observer != nullptr) {
      options.observer->on_layer_end(index, created, factory.merged_in_layer());
    }
    if (result.halted_at) {
      break;
    }
    frontier = std::move(next);
  }

  result.success = !result.error.has_value();
  return result;
}

}  // namespace qualsim
