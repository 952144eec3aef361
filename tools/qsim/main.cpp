// qsim - qualsim Command Line Interface
//
// Usage:
//   qsim run <object> --actions a[:k=v],b [--set part.attr=level] [-o file] [-j N] [-v]
//   qsim check
//   qsim describe <object>
//   qsim replay <history.json>
//
#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <rang.hpp>

#include "cli_args.hpp"
#include "qualsim/basic/diagnostic_printer.hpp"
#include "qualsim/driver/simulation_driver.hpp"
#include "qualsim/io/history.hpp"
#include "qualsim/io/kb_loader.hpp"
#include "qualsim/project/project_config.hpp"

namespace fs = std::filesystem;

using qualsim::cli::CommandArgs;

namespace
{

constexpr int k_exit_ok = 0;
constexpr int k_exit_error = 1;
constexpr int k_exit_halted = 2;

// ============================================================================
// Output Formatting
// ============================================================================

bool stderr_is_tty() { return isatty(fileno(stderr)) != 0; }
bool stdout_is_tty() { return isatty(fileno(stdout)) != 0; }

void print_diagnostics(const qualsim::DiagnosticBag & diagnostics, const qualsim::SourceTexts & sources)
{
  qualsim::DiagnosticPrinter printer(std::cerr, stderr_is_tty());
  printer.print_all(diagnostics, sources);
}

void print_status(std::ostream & os, qualsim::NodeStatus status, bool use_color)
{
  if (use_color) {
    switch (status) {
      case qualsim::NodeStatus::Ok:
        os << rang::fg::green;
        break;
      case qualsim::NodeStatus::Rejected:
        os << rang::fg::yellow;
        break;
      case qualsim::NodeStatus::ConstraintViolated:
      case qualsim::NodeStatus::Error:
        os << rang::fg::red;
        break;
    }
  }
  os << qualsim::to_string(status);
  if (use_color) {
    os << rang::style::reset;
  }
}

void print_snapshot(std::ostream & os, const qualsim::WorldSnapshot & snapshot)
{
  for (const auto & [path, value] : snapshot.values()) {
    fmt::print(os, "      {} = {}\n", path.str(), value.describe());
  }
}

/// --verbose progress, written to stderr as layers are committed.
class ProgressPrinter : public qualsim::RunObserver
{
public:
  void on_layer_begin(
    size_t index, const qualsim::ActionRequest & request, size_t frontier) override
  {
    fmt::print(stderr, "[layer {}] {} on {} leaf(s)\n", index + 1, request.describe(), frontier);
  }

  void on_node(const qualsim::TreeNode & node, bool merged) override
  {
    fmt::print(
      stderr, "  {} {} ({})\n", merged ? "merged into" : "created", node.name(),
      qualsim::to_string(node.status));
  }

  void on_layer_end(size_t index, size_t created, size_t merged) override
  {
    fmt::print(stderr, "[layer {}] {} new node(s), {} merge(s)\n", index + 1, created, merged);
  }
};

// ============================================================================
// Project Resolution
// ============================================================================

/// Project from --kb paths if given, otherwise from qualsim.yaml.
std::optional<qualsim::ProjectConfig> resolve_project(const CommandArgs & args)
{
  if (!args.kb_paths.empty()) {
    qualsim::ProjectConfig config;
    config.project_root = fs::current_path();
    for (const auto & p : args.kb_paths) {
      config.knowledge_base.paths.emplace_back(p);
    }
    return config;
  }

  auto config_path = qualsim::find_project_config(fs::current_path());
  if (!config_path) {
    std::cerr << "error: no " << qualsim::k_project_config_file_name
              << " found in current directory or parents (use --kb <path>)\n";
    return std::nullopt;
  }

  auto config_result = qualsim::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return std::nullopt;
  }
  if (args.verbose) {
    std::cerr << "Using project: " << config_path->string() << "\n";
  }
  return std::move(config_result.config);
}

// ============================================================================
// Commands
// ============================================================================

int cmd_run(const CommandArgs & args)
{
  if (args.input.empty()) {
    std::cerr << "error: object type required\n"
              << "usage: qsim run <object> --actions <list>\n";
    return k_exit_error;
  }
  if (args.actions.empty()) {
    std::cerr << "error: --actions is required\n";
    return k_exit_error;
  }

  auto requests = qualsim::parse_action_requests(args.actions);
  if (!requests) {
    std::cerr << "error: invalid action list '" << args.actions << "'\n";
    return k_exit_error;
  }

  const auto config = resolve_project(args);
  if (!config) {
    return k_exit_error;
  }

  ProgressPrinter progress;
  qualsim::SimulationOptions options;
  options.object_type = args.input;
  options.requests = std::move(*requests);
  options.initial_values = args.initial_values;
  options.jobs = args.jobs;
  options.write_history = !args.no_history;
  if (!args.output_path.empty()) {
    options.output_file = fs::path(args.output_path);
  }
  if (args.verbose) {
    options.observer = &progress;
  }

  const auto outcome = qualsim::SimulationDriver::simulate(*config, options);

  if (!outcome.diagnostics.empty()) {
    print_diagnostics(outcome.diagnostics, outcome.sources);
  }
  if (!outcome.run) {
    return k_exit_error;
  }

  const auto & graph = outcome.run->graph;
  const auto stats = graph.statistics();
  const bool color = stdout_is_tty();

  fmt::print(
    std::cout, "{}: {} node(s), depth {}, {} leaf(s), {} merged\n", graph.simulation_id(),
    stats.total_nodes, stats.depth, stats.leaf_count, stats.merged_nodes);
  for (const auto id : graph.leaves()) {
    const auto & node = graph.node(id);
    fmt::print(std::cout, "  {} [", node.name());
    print_status(std::cout, node.status, color);
    std::cout << "]";
    if (const auto * edge = node.primary_edge()) {
      if (edge->reason) {
        fmt::print(std::cout, " {}", *edge->reason);
      } else if (edge->error) {
        fmt::print(std::cout, " {}", edge->error->describe());
      } else if (!edge->violations.empty()) {
        fmt::print(std::cout, " violates {}", edge->violations.front());
      }
    }
    std::cout << "\n";
    if (args.verbose) {
      print_snapshot(std::cout, node.snapshot);
    }
  }

  if (outcome.history_file) {
    std::cerr << "History: " << outcome.history_file->string() << "\n";
  }

  if (outcome.halted) {
    std::cerr << "error: run halted at action " << (*outcome.run->halted_at + 1) << ": "
              << outcome.run->error->describe() << "\n";
    return k_exit_halted;
  }
  return outcome.success ? k_exit_ok : k_exit_error;
}

int cmd_check(const CommandArgs & args)
{
  const auto config = resolve_project(args);
  if (!config) {
    return k_exit_error;
  }

  const auto loaded = qualsim::SimulationDriver::load_knowledge_base(*config);
  if (!loaded.diagnostics.empty()) {
    print_diagnostics(loaded.diagnostics, loaded.sources);
  }
  if (!loaded.success) {
    return k_exit_error;
  }

  std::cout << "knowledge base: OK (" << loaded.kb.spaces().size() << " spaces, "
            << loaded.kb.object_types().size() << " object types, " << loaded.kb.actions().size()
            << " actions)\n";
  return k_exit_ok;
}

int cmd_describe(const CommandArgs & args)
{
  if (args.input.empty()) {
    std::cerr << "error: object type required\n"
              << "usage: qsim describe <object>\n";
    return k_exit_error;
  }

  const auto config = resolve_project(args);
  if (!config) {
    return k_exit_error;
  }

  const auto loaded = qualsim::SimulationDriver::load_knowledge_base(*config);
  if (!loaded.success) {
    print_diagnostics(loaded.diagnostics, loaded.sources);
    return k_exit_error;
  }

  const auto * type = loaded.kb.find_object_type(args.input);
  if (type == nullptr) {
    std::cerr << "error: unknown object type '" << args.input << "'\n";
    return k_exit_error;
  }

  auto print_attribute = [](const std::string & path, const qualsim::AttributeSpec & spec) {
    fmt::print(
      std::cout, "    {} : {} [{}] default {}{}\n", path, spec.space->id(),
      fmt::join(spec.space->levels(), ", "), spec.default_value.value_or(spec.space->level_name(0)),
      spec.is_mutable ? "" : " (immutable)");
  };

  fmt::print(std::cout, "{}\n", type->name());
  for (const auto & [part_name, part] : type->parts()) {
    fmt::print(std::cout, "  part {}\n", part_name);
    for (const auto & [attr_name, spec] : part.attributes) {
      print_attribute(part_name + "." + attr_name, spec);
    }
  }
  if (!type->global_attributes().empty()) {
    std::cout << "  global\n";
    for (const auto & [attr_name, spec] : type->global_attributes()) {
      print_attribute(attr_name, spec);
    }
  }
  if (!type->constraints().empty()) {
    std::cout << "  constraints\n";
    for (const auto & rule : type->constraints()) {
      fmt::print(std::cout, "    {}\n", rule.describe());
    }
  }
  std::cout << "  actions\n";
  for (const auto & name : loaded.kb.action_names(type->name())) {
    fmt::print(std::cout, "    {}\n", name);
  }
  return k_exit_ok;
}

int cmd_replay(const CommandArgs & args)
{
  if (args.input.empty()) {
    std::cerr << "error: history file required\n"
              << "usage: qsim replay <history.json>\n";
    return k_exit_error;
  }

  const auto read = qualsim::read_history_file(args.input);
  if (!read.success) {
    std::cerr << "error: " << read.error << "\n";
    return k_exit_error;
  }

  const auto config = resolve_project(args);
  if (!config) {
    return k_exit_error;
  }

  const auto loaded = qualsim::SimulationDriver::load_knowledge_base(*config);
  if (!loaded.success) {
    print_diagnostics(loaded.diagnostics, loaded.sources);
    return k_exit_error;
  }

  const auto replay = qualsim::replay_history(read.history, loaded.kb);
  if (!replay.success) {
    std::cerr << "error: replay failed: " << replay.error << "\n";
    return k_exit_error;
  }

  const bool color = stdout_is_tty();
  fmt::print(
    std::cout, "{}: {} node(s) replayed, {} leaf(s)\n", args.input, replay.snapshots.size(),
    replay.leaves.size());
  for (const auto id : replay.leaves) {
    fmt::print(std::cout, "  {} [", qualsim::node_name(id));
    print_status(std::cout, replay.statuses[id], color);
    fmt::print(std::cout, "] after {}\n", replay.actions[id].empty() ? "(root)" : replay.actions[id]);
    print_snapshot(std::cout, replay.snapshots[id]);
  }
  return k_exit_ok;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = qualsim::cli::parse_args(argc, argv);

  if (args.show_help) {
    qualsim::cli::print_usage(std::cerr, argv[0]);
    return k_exit_ok;
  }

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    return k_exit_error;
  }

  if (args.command == "run") {
    return cmd_run(args);
  }

  if (args.command == "check") {
    return cmd_check(args);
  }

  if (args.command == "describe") {
    return cmd_describe(args);
  }

  if (args.command == "replay") {
    return cmd_replay(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n";
  qualsim::cli::print_usage(std::cerr, argv[0]);
  return k_exit_error;
}
