// qualsim/io/history.hpp - JSON export and compact history of a simulation graph
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "qualsim/graph/simulation_graph.hpp"
#include "qualsim/model/knowledge_base.hpp"

namespace qualsim
{

inline constexpr int k_history_format_version = 1;

/**
 * Full graph dump for visualisers: every node with its complete snapshot,
 * every incoming edge and the run statistics.
 */
[[nodiscard]] nlohmann::json to_json(const SimulationGraph & graph);

/**
 * Compact history: the root snapshot in full, then for each further node
 * (in id order) its incoming edges with their ordered change deltas and
 * branch metadata. Each node also records its snapshot fingerprint so a
 * replay can be checked.
 */
[[nodiscard]] nlohmann::json make_history(const SimulationGraph & graph);

struct ReplayResult
{
  std::vector<WorldSnapshot> snapshots;  ///< indexed by node id
  std::vector<NodeStatus> statuses;      ///< indexed by node id
  std::vector<std::string> actions;      ///< action name per node, empty on the root
  std::vector<NodeId> leaves;
  bool success = false;
  std::string error;

  static ReplayResult fail(std::string msg)
  {
    ReplayResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Rebuilds every node snapshot of @p history from the root by applying the
 * recorded deltas in node id order. Every incoming edge of a merged node
 * must reproduce the same snapshot, and every snapshot must match its
 * recorded fingerprint.
 */
[[nodiscard]] ReplayResult replay_history(const nlohmann::json & history, const KnowledgeBase & kb);

struct HistoryReadResult
{
  nlohmann::json history;
  bool success = false;
  std::string error;
};

[[nodiscard]] HistoryReadResult read_history_file(const std::filesystem::path & path);

/// Writes @p history pretty-printed. Returns an error message on failure.
[[nodiscard]] std::optional<std::string> write_history_file(
  const std::filesystem::path & path, const nlohmann::json & history);

}  // namespace qualsim
