// qsim/cli_args.hpp - Command line parsing for the qsim tool
#pragma once

#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace qualsim::cli
{

struct CommandArgs
{
  std::string command;
  std::string input;  ///< object type for run/describe, history file for replay
  std::string actions;
  std::map<std::string, std::vector<std::string>> initial_values;
  std::vector<std::string> kb_paths;
  std::string output_path;
  std::optional<unsigned> jobs;
  bool no_history = false;
  bool verbose = false;
  bool show_help = false;

  /// First problem found while parsing; empty when the arguments are usable
  std::string error;
};

/**
 * Parses `qsim <command> [options]`. Never exits; problems are reported
 * through CommandArgs::error.
 */
[[nodiscard]] CommandArgs parse_args(int argc, const char * const argv[]);

/**
 * Parses one --set operand, "part.attr=value" or "part.attr=v1|v2".
 */
[[nodiscard]] std::optional<std::pair<std::string, std::vector<std::string>>> parse_set_value(
  std::string_view text);

void print_usage(std::ostream & os, const char * program_name);

}  // namespace qualsim::cli
