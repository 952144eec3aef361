// qsim/cli_args.cpp - Command line parsing for the qsim tool
#include "cli_args.hpp"

#include <charconv>
#include <ostream>

namespace qualsim::cli
{

namespace
{

std::optional<unsigned> parse_jobs(std::string_view text)
{
  unsigned value = 0;
  auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size() || value == 0) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<std::pair<std::string, std::vector<std::string>>> parse_set_value(
  std::string_view text)
{
  const size_t eq = text.find('=');
  if (eq == std::string_view::npos || eq == 0 || eq + 1 == text.size()) {
    return std::nullopt;
  }

  std::vector<std::string> levels;
  std::string_view rest = text.substr(eq + 1);
  while (true) {
    const size_t bar = rest.find('|');
    const std::string_view level = rest.substr(0, bar);
    if (level.empty()) {
      return std::nullopt;
    }
    levels.emplace_back(level);
    if (bar == std::string_view::npos) {
      break;
    }
    rest.remove_prefix(bar + 1);
  }
  return std::make_pair(std::string(text.substr(0, eq)), std::move(levels));
}

CommandArgs parse_args(int argc, const char * const argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  auto value_of = [&](int & i, std::string_view flag) -> const char * {
    if (i + 1 < argc) {
      return argv[++i];
    }
    if (args.error.empty()) {
      args.error = std::string(flag) + " requires a value";
    }
    return nullptr;
  };

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "-a" || arg == "--actions") {
      if (const char * v = value_of(i, arg)) {
        args.actions = v;
      }
    } else if (arg == "-s" || arg == "--set") {
      if (const char * v = value_of(i, arg)) {
        if (auto parsed = parse_set_value(v)) {
          args.initial_values[parsed->first] = std::move(parsed->second);
        } else if (args.error.empty()) {
          args.error = "invalid --set value '" + std::string(v) + "' (expected part.attr=level)";
        }
      }
    } else if (arg == "--kb") {
      if (const char * v = value_of(i, arg)) {
        args.kb_paths.emplace_back(v);
      }
    } else if (arg == "-o" || arg == "--output") {
      if (const char * v = value_of(i, arg)) {
        args.output_path = v;
      }
    } else if (arg == "-j" || arg == "--jobs") {
      if (const char * v = value_of(i, arg)) {
        args.jobs = parse_jobs(v);
        if (!args.jobs && args.error.empty()) {
          args.error = "invalid --jobs value '" + std::string(v) + "'";
        }
      }
    } else if (arg == "--no-history") {
      args.no_history = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (!arg.empty() && arg[0] != '-' && args.input.empty()) {
      args.input = arg;
    } else if (args.error.empty()) {
      args.error = "unexpected argument '" + arg + "'";
    }
  }

  return args;
}

void print_usage(std::ostream & os, const char * program_name)
{
  os << "qualsim qualitative state simulator v0.1.0\n\n"
     << "Usage: " << program_name << " <command> [options]\n\n"
     << "Commands:\n"
     << "  run <object> --actions <list>  Simulate an action sequence\n"
     << "  check                          Validate the knowledge base\n"
     << "  describe <object>              Show parts, attributes and actions\n"
     << "  replay <history.json>          Rebuild snapshots from a history file\n\n"
     << "Options:\n"
     << "  -a, --actions <list>     Actions, e.g. turn_on,set_mode:mode=high,turn_off\n"
     << "  -s, --set <p.a=v[|v]>    Initial value of an attribute (repeatable)\n"
     << "  --kb <path>              Knowledge base file or directory (repeatable)\n"
     << "  -o, --output <file>      History file to write\n"
     << "  -j, --jobs <n>           Worker threads per layer\n"
     << "  --no-history             Do not write a history file\n"
     << "  -v, --verbose            Verbose output\n"
     << "  -h, --help               Show this help message\n\n"
     << "Without --kb the knowledge base paths come from qualsim.yaml.\n";
}

}  // namespace qualsim::cli
