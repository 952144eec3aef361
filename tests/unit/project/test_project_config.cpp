// tests/unit/project/test_project_config.cpp - qualsim.yaml loading and lookup
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "qualsim/project/project_config.hpp"

using namespace qualsim;

namespace fs = std::filesystem;

namespace
{

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

}  // namespace

TEST(ProjectConfig, LoadsAllSections)
{
  const fs::path dir = make_temp_dir("qualsim_cfg");
  write_all(dir / "qualsim.yaml", R"yaml(
project:
  name: flashlight-lab
knowledge_base:
  paths: [kb/core, extra.yaml]
simulation:
  output_dir: out/histories
  jobs: 4
)yaml");

  const auto r = load_project_config(dir / "qualsim.yaml");
  ASSERT_TRUE(r.success) << r.error;
  EXPECT_EQ(r.config.project.name, "flashlight-lab");
  ASSERT_EQ(r.config.knowledge_base.paths.size(), 2U);
  EXPECT_EQ(r.config.simulation.jobs, 4U);

  const auto kb_paths = r.config.resolved_kb_paths();
  EXPECT_EQ(kb_paths[0], r.config.project_root / "kb/core");
  EXPECT_TRUE(kb_paths[1].is_absolute());
  EXPECT_EQ(r.config.resolved_output_dir(), r.config.project_root / "out/histories");

  fs::remove_all(dir);
}

TEST(ProjectConfig, Defaults)
{
  const fs::path dir = make_temp_dir("qualsim_cfg_defaults");
  write_all(dir / "qualsim.yaml", "project:\n  name: bare\n");

  const auto r = load_project_config(dir / "qualsim.yaml");
  ASSERT_TRUE(r.success) << r.error;
  ASSERT_EQ(r.config.knowledge_base.paths.size(), 1U);
  EXPECT_EQ(r.config.knowledge_base.paths[0], fs::path("kb"));
  EXPECT_EQ(r.config.simulation.jobs, 1U);
  EXPECT_EQ(r.config.simulation.output_dir, fs::path("histories"));

  fs::remove_all(dir);
}

TEST(ProjectConfig, RejectsInvalidValues)
{
  const fs::path dir = make_temp_dir("qualsim_cfg_invalid");

  write_all(dir / "qualsim.yaml", "simulation:\n  jobs: 0\n");
  auto r = load_project_config(dir / "qualsim.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("jobs"), std::string::npos);

  write_all(dir / "qualsim.yaml", "knowledge_base:\n  paths: kb\n");
  r = load_project_config(dir / "qualsim.yaml");
  EXPECT_FALSE(r.success);

  write_all(dir / "qualsim.yaml", "simulation:\n  jobs: many\n");
  r = load_project_config(dir / "qualsim.yaml");
  EXPECT_FALSE(r.success);

  write_all(dir / "qualsim.yaml", "project: [unclosed\n");
  r = load_project_config(dir / "qualsim.yaml");
  EXPECT_FALSE(r.success);

  r = load_project_config(dir / "missing.yaml");
  EXPECT_FALSE(r.success);
  EXPECT_NE(r.error.find("not found"), std::string::npos);

  fs::remove_all(dir);
}

TEST(ProjectConfig, FindSearchesUpward)
{
  const fs::path dir = make_temp_dir("qualsim_cfg_find");
  write_all(dir / "qualsim.yaml", "project:\n  name: up\n");
  fs::create_directories(dir / "a" / "b");

  const auto found = find_project_config(dir / "a" / "b");
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::canonical(*found), fs::canonical(dir / "qualsim.yaml"));

  fs::remove_all(dir);
}
