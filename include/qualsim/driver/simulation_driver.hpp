// qualsim/driver/simulation_driver.hpp - Simulation driver
//
// Single entry point for the load, validate, simulate and record pipeline.
// Used by the qsim CLI and usable from other tools.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "qualsim/basic/diagnostic.hpp"
#include "qualsim/basic/diagnostic_printer.hpp"
#include "qualsim/graph/tree_runner.hpp"
#include "qualsim/io/kb_loader.hpp"
#include "qualsim/project/project_config.hpp"

namespace qualsim
{

// ============================================================================
// Simulation Options
// ============================================================================

struct SimulationOptions
{
  std::string object_type;
  std::vector<ActionRequest> requests;

  /// Root overrides, "part.attr" -> levels
  std::map<std::string, std::vector<std::string>> initial_values;

  /// Simulation id recorded in the history (defaults to the object type)
  std::optional<std::string> simulation_id;

  /// History file (overrides simulation.output_dir from the project)
  std::optional<std::filesystem::path> output_file;

  /// Worker threads (overrides simulation.jobs from the project)
  std::optional<unsigned> jobs;

  /// Skip writing the history file
  bool write_history = true;

  RunObserver * observer = nullptr;
};

// ============================================================================
// Simulation Result
// ============================================================================

struct SimulationOutcome
{
  /// Whether the knowledge base loaded and the run completed without halting
  bool success = false;

  /// Whether the run stopped on a structured failure
  bool halted = false;

  /// Loader diagnostics plus driver errors
  DiagnosticBag diagnostics;

  /// Texts of every knowledge base file, for diagnostic snippets
  SourceTexts sources;

  /// Owns the spaces every snapshot in `run` points into
  KnowledgeBase kb;

  std::optional<RunResult> run;

  /// Written history file, if any
  std::optional<std::filesystem::path> history_file;
};

// ============================================================================
// SimulationDriver
// ============================================================================

/**
 * Orchestrates one simulation:
 * 1. Knowledge base loading and validation
 * 2. Object type and request checks
 * 3. TreeRunner expansion
 * 4. History serialisation
 */
class SimulationDriver
{
public:
  /// Loads and validates the knowledge base named by @p config.
  [[nodiscard]] static KbLoadResult load_knowledge_base(const ProjectConfig & config);

  [[nodiscard]] static SimulationOutcome simulate(
    const ProjectConfig & config, const SimulationOptions & options);

  /// Runs on an already loaded knowledge base; no history is written.
  [[nodiscard]] static RunResult simulate(
    const KnowledgeBase & kb, const SimulationOptions & options, DiagnosticBag & diags);
};

}  // namespace qualsim
