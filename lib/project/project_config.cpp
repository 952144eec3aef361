// qualsim/project/project_config.cpp - Project configuration implementation
//
#include "qualsim/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <string>

namespace qualsim
{

std::vector<std::filesystem::path> ProjectConfig::resolved_kb_paths() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(knowledge_base.paths.size());
  for (const auto & p : knowledge_base.paths) {
    out.push_back(p.is_absolute() ? p : project_root / p);
  }
  return out;
}

std::filesystem::path ProjectConfig::resolved_output_dir() const
{
  return simulation.output_dir.is_absolute() ? simulation.output_dir
                                             : project_root / simulation.output_dir;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  try {
    // Parse 'project' section
    if (root["project"]) {
      const auto & proj = root["project"];
      if (proj["name"]) {
        config.project.name = proj["name"].as<std::string>();
      }
    }

    // Parse 'knowledge_base' section
    if (root["knowledge_base"]) {
      const auto & kb = root["knowledge_base"];
      if (kb["paths"]) {
        if (!kb["paths"].IsSequence()) {
          return ConfigLoadResult::fail("knowledge_base.paths must be a list");
        }
        for (const auto & p : kb["paths"]) {
          config.knowledge_base.paths.emplace_back(p.as<std::string>());
        }
      }
    }

    // Parse 'simulation' section
    if (root["simulation"]) {
      const auto & sim = root["simulation"];
      if (sim["output_dir"]) {
        config.simulation.output_dir = sim["output_dir"].as<std::string>();
      }
      if (sim["jobs"]) {
        const int jobs = sim["jobs"].as<int>();
        if (jobs < 1) {
          return ConfigLoadResult::fail(
            "invalid simulation.jobs: " + std::to_string(jobs) + " (must be at least 1)");
        }
        config.simulation.jobs = static_cast<unsigned>(jobs);
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }

  if (config.knowledge_base.paths.empty()) {
    config.knowledge_base.paths.emplace_back("kb");
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace qualsim
