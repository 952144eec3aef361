// tests/cli/test_cli_args.cpp - qsim argument parsing
//
#include <gtest/gtest.h>

#include <sstream>
#include <vector>

#include "cli_args.hpp"

using namespace qualsim::cli;

namespace
{

CommandArgs parse(std::vector<const char *> argv)
{
  argv.insert(argv.begin(), "qsim");
  return parse_args(static_cast<int>(argv.size()), argv.data());
}

}  // namespace

TEST(CliArgs, RunWithAllOptions)
{
  const CommandArgs args = parse(
    {"run", "flashlight", "-a", "turn_on,turn_off", "-s", "battery.level=low|medium", "--kb",
     "models", "--kb", "more", "-o", "out.json", "-j", "3", "--no-history", "-v"});
  EXPECT_TRUE(args.error.empty()) << args.error;
  EXPECT_EQ(args.command, "run");
  EXPECT_EQ(args.input, "flashlight");
  EXPECT_EQ(args.actions, "turn_on,turn_off");
  ASSERT_EQ(args.initial_values.count("battery.level"), 1U);
  EXPECT_EQ(args.initial_values.at("battery.level"), (std::vector<std::string>{"low", "medium"}));
  EXPECT_EQ(args.kb_paths, (std::vector<std::string>{"models", "more"}));
  EXPECT_EQ(args.output_path, "out.json");
  ASSERT_TRUE(args.jobs.has_value());
  EXPECT_EQ(*args.jobs, 3U);
  EXPECT_TRUE(args.no_history);
  EXPECT_TRUE(args.verbose);
}

TEST(CliArgs, HelpAndEmptyCommandLine)
{
  EXPECT_TRUE(parse({}).show_help);
  EXPECT_TRUE(parse({"--help"}).show_help);
  EXPECT_TRUE(parse({"run", "-h"}).show_help);
}

TEST(CliArgs, Errors)
{
  EXPECT_FALSE(parse({"run", "flashlight", "-a"}).error.empty());
  EXPECT_FALSE(parse({"run", "flashlight", "-j", "0"}).error.empty());
  EXPECT_FALSE(parse({"run", "flashlight", "-j", "two"}).error.empty());
  EXPECT_FALSE(parse({"run", "flashlight", "--bogus"}).error.empty());
  EXPECT_FALSE(parse({"run", "flashlight", "extra"}).error.empty());
  EXPECT_FALSE(parse({"run", "flashlight", "-s", "battery.level"}).error.empty());
}

TEST(CliArgs, ParseSetValue)
{
  const auto one = parse_set_value("bulb.state=on");
  ASSERT_TRUE(one.has_value());
  EXPECT_EQ(one->first, "bulb.state");
  EXPECT_EQ(one->second, (std::vector<std::string>{"on"}));

  EXPECT_FALSE(parse_set_value("=on").has_value());
  EXPECT_FALSE(parse_set_value("bulb.state=").has_value());
  EXPECT_FALSE(parse_set_value("battery.level=low||high").has_value());
  EXPECT_FALSE(parse_set_value("battery.level=low|").has_value());
}

TEST(CliArgs, UsageMentionsCommands)
{
  std::ostringstream os;
  print_usage(os, "qsim");
  const std::string text = os.str();
  EXPECT_NE(text.find("Usage: qsim"), std::string::npos);
  EXPECT_NE(text.find("replay"), std::string::npos);
  EXPECT_NE(text.find("--no-history"), std::string::npos);
}
