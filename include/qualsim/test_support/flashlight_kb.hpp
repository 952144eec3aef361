// qualsim/test_support/flashlight_kb.hpp - Flashlight knowledge base for tests
//
// The same model is available in memory (make_flashlight_kb) and as YAML
// (k_flashlight_yaml) so loader tests can compare the two.
//
#pragma once

#include <utility>

#include "qualsim/model/knowledge_base.hpp"

namespace qualsim::test_support
{

/**
 * flashlight
 *   battery.level     battery_level {empty, low, medium, high, full}, default unknown
 *   bulb.state        binary_state {off, on}
 *   bulb.brightness   brightness {none, low, medium, high}
 *   switch.position   binary_state
 *   model             flashlight_model {standard, tactical}, immutable
 *
 * Rule: bulb.state == on requires battery.level != empty.
 *
 * Actions: turn_on, turn_off, set_brightness(level), replace_battery
 * (generic) and break_model (writes the immutable attribute).
 */
inline KnowledgeBase make_flashlight_kb()
{
  KnowledgeBaseBuilder b;
  const QualitativeSpace * binary =
    b.add_space(QualitativeSpace{"binary_state", "Binary state", {"off", "on"}});
  const QualitativeSpace * battery = b.add_space(QualitativeSpace{
    "battery_level", "Battery level", {"empty", "low", "medium", "high", "full"}});
  const QualitativeSpace * brightness =
    b.add_space(QualitativeSpace{"brightness", "Brightness", {"none", "low", "medium", "high"}});
  const QualitativeSpace * model =
    b.add_space(QualitativeSpace{"flashlight_model", "Model", {"standard", "tactical"}});

  ObjectType type("flashlight");

  PartSpec battery_part;
  battery_part.name = "battery";
  battery_part.attributes["level"] = AttributeSpec{"level", battery, true, "unknown"};
  type.add_part(std::move(battery_part));

  PartSpec bulb;
  bulb.name = "bulb";
  bulb.attributes["state"] = AttributeSpec{"state", binary, true, "off"};
  bulb.attributes["brightness"] = AttributeSpec{"brightness", brightness, true, "none"};
  type.add_part(std::move(bulb));

  PartSpec sw;
  sw.name = "switch";
  sw.attributes["position"] = AttributeSpec{"position", binary, true, "off"};
  type.add_part(std::move(sw));

  type.add_global_attribute(AttributeSpec{"model", model, false, "standard"});

  type.add_constraint(DependencyRule{
    "bulb_needs_power", check("bulb.state", CompareOp::Equals, {"on"}),
    check("battery.level", CompareOp::NotEquals, {"empty"})});
  b.add_object_type(std::move(type));

  Action turn_on;
  turn_on.name = "turn_on";
  turn_on.object_type = "flashlight";
  turn_on.preconditions.push_back(check("battery.level", CompareOp::NotEquals, {"empty"}));
  turn_on.effects.push_back(set_attribute("switch.position", "on"));
  turn_on.effects.push_back(set_attribute("bulb.state", "on"));
  {
    std::vector<Effect> full_then;
    full_then.push_back(set_attribute("bulb.brightness", "high"));
    std::vector<Effect> high_then;
    high_then.push_back(set_attribute("bulb.brightness", "high"));
    std::vector<Effect> otherwise;
    otherwise.push_back(set_attribute("bulb.brightness", "medium"));
    std::vector<Effect> elif;
    elif.push_back(when(
      check("battery.level", CompareOp::Equals, {"high"}), std::move(high_then),
      std::move(otherwise)));
    turn_on.effects.push_back(when(
      check("battery.level", CompareOp::Equals, {"full"}), std::move(full_then), std::move(elif)));
  }
  turn_on.effects.push_back(set_trend("battery.level", Trend::Down));
  b.add_action(std::move(turn_on));

  Action turn_off;
  turn_off.name = "turn_off";
  turn_off.object_type = "flashlight";
  turn_off.preconditions.push_back(check("switch.position", CompareOp::Equals, {"on"}));
  turn_off.effects.push_back(set_attribute("switch.position", "off"));
  turn_off.effects.push_back(set_attribute("bulb.state", "off"));
  turn_off.effects.push_back(set_attribute("bulb.brightness", "none"));
  turn_off.effects.push_back(set_trend("battery.level", Trend::None));
  b.add_action(std::move(turn_off));

  Action set_brightness;
  set_brightness.name = "set_brightness";
  set_brightness.object_type = "flashlight";
  set_brightness.parameters.push_back(ParameterSpec{"level", "choice", {"low", "medium", "high"}, true});
  set_brightness.preconditions.push_back(check("bulb.state", CompareOp::Equals, {"on"}));
  set_brightness.effects.push_back(set_attribute_from("bulb.brightness", "level"));
  b.add_action(std::move(set_brightness));

  Action replace_battery;
  replace_battery.name = "replace_battery";
  replace_battery.effects.push_back(set_attribute("battery.level", "full"));
  replace_battery.effects.push_back(set_trend("battery.level", Trend::None));
  b.add_action(std::move(replace_battery));

  Action break_model;
  break_model.name = "break_model";
  break_model.object_type = "flashlight";
  break_model.effects.push_back(set_attribute("model", "tactical"));
  b.add_action(std::move(break_model));

  return std::move(b).build();
}

/// make_flashlight_kb() without break_model, as three YAML documents.
inline constexpr const char * k_flashlight_yaml = R"yaml(
spaces:
  - id: binary_state
    name: Binary state
    levels: [off, on]
  - id: battery_level
    name: Battery level
    levels: [empty, low, medium, high, full]
  - id: brightness
    name: Brightness
    levels: [none, low, medium, high]
  - id: flashlight_model
    name: Model
    levels: [standard, tactical]
---
type: flashlight
parts:
  battery:
    attributes:
      level: {space: battery_level, default: unknown}
  bulb:
    attributes:
      state: {space: binary_state, default: off}
      brightness: {space: brightness, default: none}
  switch:
    attributes:
      position: {space: binary_state, default: off}
global_attributes:
  model: {space: flashlight_model, default: standard, mutable: false}
constraints:
  - type: dependency
    name: bulb_needs_power
    condition: {type: attribute_check, target: bulb.state, operator: equals, value: on}
    requires: {type: attribute_check, target: battery.level, operator: not_equals, value: empty}
---
action: turn_on
object_type: flashlight
preconditions:
  - {type: attribute_check, target: battery.level, operator: not_equals, value: empty}
effects:
  - {type: set_attribute, target: switch.position, value: on}
  - {type: set_attribute, target: bulb.state, value: on}
  - type: conditional
    condition: {type: attribute_check, target: battery.level, operator: equals, value: full}
    then:
      - {type: set_attribute, target: bulb.brightness, value: high}
    else:
      type: conditional
      condition: {type: attribute_check, target: battery.level, operator: equals, value: high}
      then: {type: set_attribute, target: bulb.brightness, value: high}
      else: {type: set_attribute, target: bulb.brightness, value: medium}
  - {type: set_trend, target: battery.level, direction: down}
---
action: turn_off
object_type: flashlight
preconditions:
  - {type: attribute_check, target: switch.position, operator: equals, value: on}
effects:
  - {type: set_attribute, target: switch.position, value: off}
  - {type: set_attribute, target: bulb.state, value: off}
  - {type: set_attribute, target: bulb.brightness, value: none}
  - {type: set_trend, target: battery.level, direction: none}
---
action: set_brightness
object_type: flashlight
parameters:
  level: {type: choice, choices: [low, medium, high]}
preconditions:
  - {type: attribute_check, target: bulb.state, operator: equals, value: on}
effects:
  - type: set_attribute
    target: bulb.brightness
    value: {type: parameter_ref, name: level}
---
action: replace_battery
object_type: generic
effects:
  - {type: set_attribute, target: battery.level, value: full}
  - {type: set_trend, target: battery.level, direction: none}
)yaml";

}  // namespace qualsim::test_support
