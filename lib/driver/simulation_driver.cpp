// qualsim/driver/simulation_driver.cpp - Simulation driver implementation
//
#include "qualsim/driver/simulation_driver.hpp"

#include <fmt/core.h>

#include <utility>

#include "qualsim/io/history.hpp"

namespace qualsim
{

KbLoadResult SimulationDriver::load_knowledge_base(const ProjectConfig & config)
{
  return load_knowledge_base_files(config.resolved_kb_paths());
}

RunResult SimulationDriver::simulate(
  const KnowledgeBase & kb, const SimulationOptions & options, DiagnosticBag & diags)
{
  RunResult result;

  if (kb.find_object_type(options.object_type) == nullptr) {
    diags.report_error(KbLocation{}, fmt::format("unknown object type '{}'", options.object_type));
    return result;
  }
  if (options.requests.empty()) {
    diags.report_error(KbLocation{}, "no actions to simulate");
    return result;
  }

  RunOptions run_options;
  run_options.simulation_id = options.simulation_id.value_or(options.object_type);
  run_options.initial_values = options.initial_values;
  run_options.jobs = options.jobs.value_or(1);
  run_options.observer = options.observer;

  TreeRunner runner(kb);
  result = runner.run(options.object_type, options.requests, run_options);

  if (result.error && !result.halted_at) {
    // Setup failure before any layer ran (bad initial values and the like)
    diags.report_error(KbLocation{}, result.error->describe());
  }
  return result;
}

SimulationOutcome SimulationDriver::simulate(
  const ProjectConfig & config, const SimulationOptions & options)
{
  SimulationOutcome outcome;

  KbLoadResult loaded = load_knowledge_base(config);
  outcome.diagnostics = std::move(loaded.diagnostics);
  outcome.sources = std::move(loaded.sources);
  outcome.kb = std::move(loaded.kb);
  if (!loaded.success) {
    return outcome;
  }

  SimulationOptions effective = options;
  if (!effective.jobs) {
    effective.jobs = config.simulation.jobs;
  }

  RunResult run = simulate(outcome.kb, effective, outcome.diagnostics);
  if (run.graph.empty()) {
    return outcome;
  }

  outcome.halted = run.halted_at.has_value();

  if (effective.write_history) {
    const std::filesystem::path path = effective.output_file.value_or(
      config.resolved_output_dir() / (run.graph.simulation_id() + ".json"));
    if (auto error = write_history_file(path, make_history(run.graph))) {
      outcome.diagnostics.report_error(KbLocation{}, *error);
    } else {
      outcome.history_file = path;
    }
  }

  outcome.run = std::move(run);
  outcome.success = !outcome.halted && !outcome.diagnostics.has_errors();
  return outcome;
}

}  // namespace qualsim
