// qualsim/project/project_config.hpp - Project configuration (qualsim.yaml)
//
// Parses and validates qualsim.yaml project files. Relative paths are
// resolved against the directory that holds the file.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace qualsim
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Where the knowledge base YAML files live.
 */
struct KnowledgeBaseConfig
{
  /// Files or directories, searched recursively for *.yaml / *.yml
  std::vector<std::filesystem::path> paths;
};

/**
 * Simulation defaults, overridable from the command line.
 */
struct SimulationConfig
{
  /// Directory that receives history JSON files
  std::filesystem::path output_dir = "histories";

  /// Worker threads used to expand the leaves of one layer
  unsigned jobs = 1;
};

struct ProjectInfo
{
  std::string name;
};

/**
 * Complete project configuration (qualsim.yaml).
 */
struct ProjectConfig
{
  ProjectInfo project;
  KnowledgeBaseConfig knowledge_base;
  SimulationConfig simulation;

  /// Directory containing qualsim.yaml
  std::filesystem::path project_root;

  /// knowledge_base.paths made absolute
  [[nodiscard]] std::vector<std::filesystem::path> resolved_kb_paths() const;

  /// simulation.output_dir made absolute
  [[nodiscard]] std::filesystem::path resolved_output_dir() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a qualsim.yaml file.
 *
 * @param config_path Path to qualsim.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to qualsim.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "qualsim.yaml";

}  // namespace qualsim
