// tests/unit/io/test_kb_loader.cpp - YAML loading and knowledge base validation
//
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "qualsim/graph/tree_runner.hpp"
#include "qualsim/io/kb_loader.hpp"
#include "qualsim/test_support/flashlight_kb.hpp"

using namespace qualsim;

namespace fs = std::filesystem;

namespace
{

/// The flashlight model plus one extra YAML document.
KbLoadResult load_with(const std::string & extra)
{
  return load_knowledge_base(
    {KbSource{"flashlight.yaml", test_support::k_flashlight_yaml},
     KbSource{"extra.yaml", extra}});
}

const Diagnostic * find_code(const DiagnosticBag & bag, std::string_view code)
{
  for (const auto & d : bag) {
    if (d.code == code) {
      return &d;
    }
  }
  return nullptr;
}

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

// ============================================================================
// Well-formed input
// ============================================================================

TEST(IoKbLoader, LoadsFlashlightModel)
{
  const KbLoadResult r =
    load_knowledge_base({KbSource{"flashlight.yaml", test_support::k_flashlight_yaml}});
  ASSERT_TRUE(r.success);
  EXPECT_FALSE(r.diagnostics.has_errors());
  EXPECT_EQ(r.kb.spaces().size(), 4U);

  const ObjectType * type = r.kb.find_object_type("flashlight");
  ASSERT_NE(type, nullptr);
  EXPECT_EQ(type->parts().size(), 3U);
  EXPECT_EQ(type->constraints().size(), 1U);
  EXPECT_EQ(type->constraints()[0].name, "bulb_needs_power");

  const AttributeSpec * model = type->find_attribute(AttributePath{"", "model"});
  ASSERT_NE(model, nullptr);
  EXPECT_FALSE(model->is_mutable);

  // "off"/"on" stay level names
  EXPECT_EQ(r.kb.find_space("binary_state")->levels(), (std::vector<std::string>{"off", "on"}));

  EXPECT_EQ(
    r.kb.action_names("flashlight"),
    (std::vector<std::string>{"replace_battery", "set_brightness", "turn_off", "turn_on"}));
  const Action * replace = r.kb.find_action("flashlight", "replace_battery");
  ASSERT_NE(replace, nullptr);
  EXPECT_TRUE(replace->is_generic());

  const Action * set_brightness = r.kb.find_action("flashlight", "set_brightness");
  ASSERT_NE(set_brightness, nullptr);
  ASSERT_EQ(set_brightness->parameters.size(), 1U);
  EXPECT_TRUE(set_brightness->parameters[0].required);
  EXPECT_EQ(set_brightness->parameters[0].choices.size(), 3U);
}

TEST(IoKbLoader, LoadedModelSimulatesLikeTheBuiltOne)
{
  const KbLoadResult loaded =
    load_knowledge_base({KbSource{"flashlight.yaml", test_support::k_flashlight_yaml}});
  ASSERT_TRUE(loaded.success);
  const KnowledgeBase built = test_support::make_flashlight_kb();

  const auto seq = *parse_action_requests("turn_on,set_brightness:level=low,turn_off,replace_battery");
  const RunResult a = TreeRunner(loaded.kb).run("flashlight", seq);
  const RunResult b = TreeRunner(built).run("flashlight", seq);

  ASSERT_TRUE(a.success);
  ASSERT_TRUE(b.success);
  ASSERT_EQ(a.graph.size(), b.graph.size());
  for (NodeId id = 0; id < a.graph.size(); ++id) {
    EXPECT_EQ(a.graph.node(id).snapshot.fingerprint(), b.graph.node(id).snapshot.fingerprint());
    EXPECT_EQ(a.graph.node(id).status, b.graph.node(id).status);
  }
}

TEST(IoKbLoader, ObjectBehaviourExtendsGenericAction)
{
  const KbLoadResult r = load_knowledge_base({KbSource{"kb.yaml", R"yaml(
spaces:
  - id: binary_state
    levels: [off, on]
---
type: lamp
parts:
  bulb:
    attributes:
      state: {space: binary_state, default: off}
  plug:
    attributes:
      connected: {space: binary_state, default: on}
behaviors:
  switch_on:
    preconditions:
      - {type: attribute_check, target: plug.connected, operator: equals, value: on}
---
action: switch_on
object_type: generic
effects:
  - {type: set_attribute, target: bulb.state, value: on}
)yaml"}});
  ASSERT_TRUE(r.success);
  const auto action = r.kb.resolve_action("lamp", "switch_on");
  ASSERT_TRUE(action.has_value());
  EXPECT_EQ(action->object_type, "lamp");
  EXPECT_EQ(action->preconditions.size(), 1U);
  EXPECT_EQ(action->effects.size(), 1U);
}

TEST(IoKbLoader, DocumentWithoutKnownKeyIsWarnedAndIgnored)
{
  const KbLoadResult r = load_with("comment: nothing to see\n");
  EXPECT_TRUE(r.success);
  EXPECT_TRUE(r.diagnostics.has_warnings());
}

// ============================================================================
// Malformed input
// ============================================================================

TEST(IoKbLoader, YamlSyntaxError)
{
  const KbLoadResult r = load_knowledge_base({KbSource{"broken.yaml", "spaces: [a, b\n"}});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K001"));
}

TEST(IoKbLoader, UnknownSpace)
{
  const KbLoadResult r = load_knowledge_base({KbSource{"bad.yaml", R"yaml(
type: lamp
parts:
  bulb:
    attributes:
      state: {space: nope}
)yaml"}});
  EXPECT_FALSE(r.success);
  const Diagnostic * d = find_code(r.diagnostics, "K002");
  ASSERT_NE(d, nullptr);
  const KbLocation where = d->primary_location();
  EXPECT_EQ(where.file, "bad.yaml");
  EXPECT_GT(where.line, 0U);
}

TEST(IoKbLoader, BadDefault)
{
  const KbLoadResult r = load_knowledge_base({KbSource{"bad.yaml", R"yaml(
spaces:
  - id: binary_state
    levels: [off, on]
---
type: lamp
parts:
  bulb:
    attributes:
      state: {space: binary_state, default: dim}
)yaml"}});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K003"));
}

TEST(IoKbLoader, SpaceShapeErrors)
{
  KbLoadResult r = load_knowledge_base({KbSource{"s.yaml", R"yaml(
spaces:
  - id: empty_space
    levels: []
)yaml"}});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K010"));

  r = load_knowledge_base({KbSource{"s.yaml", R"yaml(
spaces:
  - id: twice
    levels: [a, b, a]
)yaml"}});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K005"));

  r = load_with(R"yaml(
spaces:
  - id: binary_state
    levels: [off, on]
)yaml");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K005"));
}

TEST(IoKbLoader, DuplicatePointsAtFirstDefinition)
{
  KbLoadResult r = load_with(R"yaml(
action: turn_on
object_type: flashlight
effects:
  - {type: set_attribute, target: bulb.state, value: on}
)yaml");
  EXPECT_FALSE(r.success);
  const Diagnostic * d = find_code(r.diagnostics, "K005");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->primary_location().file, "extra.yaml");
  ASSERT_EQ(d->labels.size(), 2U);
  EXPECT_EQ(d->labels[1].style, LabelStyle::Secondary);
  EXPECT_EQ(d->labels[1].location.file, "flashlight.yaml");
  EXPECT_TRUE(d->labels[1].location.is_valid());
  EXPECT_EQ(d->labels[1].message, "first defined here");

  r = load_with(R"yaml(
spaces:
  - id: binary_state
    levels: [off, on]
)yaml");
  d = find_code(r.diagnostics, "K005");
  ASSERT_NE(d, nullptr);
  ASSERT_EQ(d->labels.size(), 2U);
  EXPECT_EQ(d->labels[1].location.file, "flashlight.yaml");
  EXPECT_EQ(d->labels[1].location.line, 3U);
}

TEST(IoKbLoader, UnknownLevelInEffect)
{
  const KbLoadResult r = load_with(R"yaml(
action: dim
object_type: flashlight
effects:
  - {type: set_attribute, target: bulb.state, value: dim}
)yaml");
  EXPECT_FALSE(r.success);
  const Diagnostic * d = find_code(r.diagnostics, "K003");
  ASSERT_NE(d, nullptr);
  EXPECT_EQ(d->primary_location().file, "extra.yaml");
}

TEST(IoKbLoader, UnknownAttribute)
{
  const KbLoadResult r = load_with(R"yaml(
action: paint
object_type: flashlight
effects:
  - {type: set_attribute, target: bulb.colour, value: red}
)yaml");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K004"));
}

TEST(IoKbLoader, OrderedOperatorNeedsOneLevel)
{
  const KbLoadResult r = load_with(R"yaml(
action: check_range
object_type: flashlight
preconditions:
  - {type: attribute_check, target: battery.level, operator: gt, value: [low, high]}
)yaml");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K006"));
}

TEST(IoKbLoader, NestedConditionalOnOtherAttribute)
{
  const KbLoadResult r = load_with(R"yaml(
action: odd
object_type: flashlight
effects:
  - type: conditional
    condition: {type: attribute_check, target: battery.level, operator: equals, value: full}
    then:
      - type: conditional
        condition: {type: attribute_check, target: bulb.state, operator: equals, value: on}
        then: {type: set_attribute, target: bulb.brightness, value: high}
        else: []
    else: []
)yaml");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K007"));
}

TEST(IoKbLoader, ImmutableWrite)
{
  const KbLoadResult r = load_with(R"yaml(
action: rebrand
object_type: flashlight
effects:
  - {type: set_attribute, target: model, value: tactical}
)yaml");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K008"));
}

TEST(IoKbLoader, UndeclaredParameter)
{
  const KbLoadResult r = load_with(R"yaml(
action: tune
object_type: flashlight
effects:
  - type: set_attribute
    target: bulb.brightness
    value: {type: parameter_ref, name: speed}
)yaml");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K009"));
}

TEST(IoKbLoader, UnknownConditionType)
{
  const KbLoadResult r = load_with(R"yaml(
action: guess
object_type: flashlight
preconditions:
  - {type: fuzzy_match, target: bulb.state}
)yaml");
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K006"));
}

TEST(IoKbValidator, BuiltModelReportsImmutableWrite)
{
  const KnowledgeBase kb = test_support::make_flashlight_kb();
  DiagnosticBag diags;
  validate_knowledge_base(kb, diags);
  EXPECT_TRUE(diags.has_code("K008"));
  EXPECT_EQ(diags.errors().size(), 1U);
}

// ============================================================================
// Files
// ============================================================================

TEST(IoKbLoaderFiles, LoadsDirectoryRecursively)
{
  const fs::path dir = make_temp_dir("qualsim_kb");
  fs::create_directories(dir / "actions");
  write_all(dir / "model.yaml", test_support::k_flashlight_yaml);
  write_all(dir / "actions" / "extra.yml", R"yaml(
action: blink
object_type: flashlight
effects:
  - {type: set_attribute, target: bulb.state, value: on}
)yaml");
  write_all(dir / "notes.txt", "not: yaml");

  const KbLoadResult r = load_knowledge_base_files({dir});
  EXPECT_TRUE(r.success);
  EXPECT_NE(r.kb.find_action("flashlight", "blink"), nullptr);
  EXPECT_EQ(r.sources.size(), 2U);

  fs::remove_all(dir);
}

TEST(IoKbLoaderFiles, MissingPathIsReported)
{
  const fs::path dir = make_temp_dir("qualsim_kb_missing");
  const KbLoadResult r = load_knowledge_base_files({dir / "does_not_exist.yaml"});
  EXPECT_FALSE(r.success);
  EXPECT_TRUE(r.diagnostics.has_code("K001"));
  fs::remove_all(dir);
}
