// qualsim/io/kb_loader.cpp - YAML knowledge base loader
//
// Parsing is split in three passes over all documents (spaces, object
// types, actions) so that files may reference each other in any order.
//
#include "qualsim/io/kb_loader.hpp"

#include <fmt/core.h>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <fstream>
#include <sstream>
#include <utility>

namespace qualsim
{

namespace
{

struct Document
{
  std::string file;
  YAML::Node root;
};

std::string normalize_scalar(const std::string & s)
{
  if (s == "true" || s == "True" || s == "TRUE") {
    return "on";
  }
  if (s == "false" || s == "False" || s == "FALSE") {
    return "off";
  }
  return s;
}

class DocumentParser
{
public:
  DocumentParser(
    std::string file, DiagnosticBag & diags, KnowledgeBaseBuilder & builder, KbOrigins & origins)
  : file_(std::move(file)), diags_(diags), builder_(builder), origins_(origins)
  {
  }

  void parse_spaces(const YAML::Node & doc);
  void parse_object_type(const YAML::Node & doc);
  void parse_action(const YAML::Node & doc);

private:
  [[nodiscard]] KbLocation loc(const YAML::Node & node) const;

  void malformed(const YAML::Node & node, const std::string & message)
  {
    diags_.report_error(loc(node), message).with_code("K006");
  }

  /// K005, pointing back at the first definition recorded under @p key.
  void duplicate(const YAML::Node & node, const std::string & key, const std::string & message)
  {
    auto diag = diags_.report_error(loc(node), message);
    diag.with_code("K005");
    if (const auto it = origins_.find(key); it != origins_.end()) {
      diag.with_secondary_label(it->second, "first defined here");
    }
  }

  std::optional<std::string> scalar(const YAML::Node & node, std::string_view what);
  std::optional<AttributePath> target(const YAML::Node & node);

  std::optional<Condition> parse_condition(const YAML::Node & node);
  std::optional<std::vector<Condition>> parse_conditions(const YAML::Node & node);
  std::optional<Effect> parse_effect(const YAML::Node & node);
  std::optional<std::vector<Effect>> parse_effects(const YAML::Node & node);

  std::optional<AttributeSpec> parse_attribute(const std::string & name, const YAML::Node & node);
  std::optional<Behavior> parse_behavior(const YAML::Node & node);

  std::string file_;
  DiagnosticBag & diags_;
  KnowledgeBaseBuilder & builder_;
  KbOrigins & origins_;
};

KbLocation DocumentParser::loc(const YAML::Node & node) const
{
  if (!node) {
    return KbLocation{file_, 0, 0};
  }
  const YAML::Mark mark = node.Mark();
  if (mark.is_null() || mark.line < 0) {
    return KbLocation{file_, 0, 0};
  }
  return KbLocation{
    file_, static_cast<uint32_t>(mark.line + 1), static_cast<uint32_t>(mark.column + 1)};
}

std::optional<std::string> DocumentParser::scalar(const YAML::Node & node, std::string_view what)
{
  if (!node || !node.IsScalar()) {
    malformed(node, fmt::format("expected a scalar for '{}'", what));
    return std::nullopt;
  }
  return node.Scalar();
}

std::optional<AttributePath> DocumentParser::target(const YAML::Node & node)
{
  auto text = scalar(node, "target");
  if (!text) {
    return std::nullopt;
  }
  auto path = AttributePath::parse(*text);
  if (!path) {
    malformed(node, fmt::format("'{}' is not an attribute path (expected part.attribute)", *text));
  }
  return path;
}

// ============================================================================
// Spaces
// ============================================================================

void DocumentParser::parse_spaces(const YAML::Node & doc)
{
  const YAML::Node list = doc["spaces"];
  if (!list.IsSequence()) {
    malformed(list, "'spaces' must be a list");
    return;
  }
  for (const auto & entry : list) {
    if (!entry.IsMap()) {
      malformed(entry, "space entry must be a mapping");
      continue;
    }
    auto id = scalar(entry["id"], "id");
    if (!id) {
      continue;
    }
    const std::string name = entry["name"] && entry["name"].IsScalar() ? entry["name"].Scalar() : *id;

    std::vector<std::string> levels;
    const YAML::Node levels_node = entry["levels"];
    if (levels_node && levels_node.IsSequence()) {
      for (const auto & l : levels_node) {
        if (auto s = scalar(l, "levels")) {
          levels.push_back(normalize_scalar(*s));
        }
      }
    }
    if (levels.empty() || levels.size() > k_max_levels) {
      diags_
        .report_error(
          loc(entry), fmt::format("space '{}' must have between 1 and {} levels", *id, k_max_levels))
        .with_code("K010");
      continue;
    }
    std::vector<std::string> sorted = levels;
    std::sort(sorted.begin(), sorted.end());
    if (std::adjacent_find(sorted.begin(), sorted.end()) != sorted.end()) {
      diags_.report_error(loc(levels_node), fmt::format("space '{}' repeats a level", *id))
        .with_code("K005");
      continue;
    }

    const std::string key = fmt::format("space:{}", *id);
    if (builder_.add_space(QualitativeSpace{*id, name, std::move(levels)}) == nullptr) {
      duplicate(entry, key, fmt::format("duplicate space '{}'", *id));
    } else {
      origins_.emplace(key, loc(entry));
    }
  }
}

// ============================================================================
// Object types
// ============================================================================

std::optional<AttributeSpec> DocumentParser::parse_attribute(
  const std::string & name, const YAML::Node & node)
{
  if (!node.IsMap()) {
    malformed(node, fmt::format("attribute '{}' must be a mapping", name));
    return std::nullopt;
  }
  auto space_id = scalar(node["space"], "space");
  if (!space_id) {
    return std::nullopt;
  }
  AttributeSpec spec;
  spec.name = name;
  spec.space = builder_.find_space(*space_id);
  if (spec.space == nullptr) {
    diags_
      .report_error(
        loc(node["space"]), fmt::format("unknown space '{}' for attribute '{}'", *space_id, name))
      .with_code("K002");
    return std::nullopt;
  }
  if (node["mutable"]) {
    spec.is_mutable = node["mutable"].IsScalar() && node["mutable"].as<bool>(true);
  }
  if (node["default"] && !node["default"].IsNull()) {
    auto def = scalar(node["default"], "default");
    if (!def) {
      return std::nullopt;
    }
    std::string value = normalize_scalar(*def);
    if (value != k_unknown_default && !spec.space->has_level(value)) {
      diags_
        .report_error(
          loc(node["default"]),
          fmt::format("default '{}' is not a level of space '{}'", value, spec.space->id()))
        .with_code("K003")
        .with_help("use a level name, 'unknown', or omit the default");
      return std::nullopt;
    }
    spec.default_value = std::move(value);
  }
  return spec;
}

std::optional<Behavior> DocumentParser::parse_behavior(const YAML::Node & node)
{
  if (!node.IsMap()) {
    malformed(node, "behavior must be a mapping");
    return std::nullopt;
  }
  auto pre = parse_conditions(node["preconditions"]);
  auto eff = parse_effects(node["effects"]);
  if (!pre || !eff) {
    return std::nullopt;
  }
  return Behavior{std::move(*pre), std::move(*eff)};
}

void DocumentParser::parse_object_type(const YAML::Node & doc)
{
  auto name = scalar(doc["type"], "type");
  if (!name) {
    return;
  }
  ObjectType type(*name);
  const std::string key = fmt::format("type:{}", *name);
  origins_.emplace(key, loc(doc["type"]));

  if (const YAML::Node parts = doc["parts"]) {
    if (!parts.IsMap()) {
      malformed(parts, "'parts' must be a mapping");
    } else {
      for (const auto & part_entry : parts) {
        PartSpec part;
        part.name = part_entry.first.as<std::string>();
        const YAML::Node attrs = part_entry.second["attributes"];
        if (attrs && attrs.IsMap()) {
          for (const auto & attr_entry : attrs) {
            const std::string attr_name = attr_entry.first.as<std::string>();
            if (auto spec = parse_attribute(attr_name, attr_entry.second)) {
              part.attributes.emplace(attr_name, std::move(*spec));
            }
          }
        }
        type.add_part(std::move(part));
      }
    }
  }

  if (const YAML::Node globals = doc["global_attributes"]) {
    if (globals.IsMap()) {
      for (const auto & attr_entry : globals) {
        const std::string attr_name = attr_entry.first.as<std::string>();
        if (auto spec = parse_attribute(attr_name, attr_entry.second)) {
          type.add_global_attribute(std::move(*spec));
        }
      }
    } else {
      malformed(globals, "'global_attributes' must be a mapping");
    }
  }

  if (const YAML::Node constraints = doc["constraints"]) {
    size_t index = 0;
    if (!constraints.IsSequence()) {
      malformed(constraints, "'constraints' must be a list");
    } else for (const auto & c : constraints) {
      const std::string kind = c["type"] && c["type"].IsScalar() ? c["type"].Scalar() : "dependency";
      if (kind != "dependency") {
        malformed(c, fmt::format("unsupported constraint type '{}'", kind));
        continue;
      }
      auto cond = parse_condition(c["condition"]);
      auto req = parse_condition(c["requires"]);
      if (!cond || !req) {
        continue;
      }
      DependencyRule rule;
      rule.name = c["name"] && c["name"].IsScalar() ? c["name"].Scalar() : "";
      rule.condition = std::move(*cond);
      rule.requirement = std::move(*req);
      origins_[fmt::format("constraint:{}:{}", *name, index++)] = loc(c);
      type.add_constraint(std::move(rule));
    }
  }

  if (const YAML::Node behaviors = doc["behaviors"]) {
    if (behaviors.IsMap()) {
      for (const auto & entry : behaviors) {
        const std::string action_name = entry.first.as<std::string>();
        if (auto b = parse_behavior(entry.second)) {
          origins_[fmt::format("behavior:{}:{}", *name, action_name)] = loc(entry.second);
          type.add_behavior(action_name, std::move(*b));
        }
      }
    } else {
      malformed(behaviors, "'behaviors' must be a mapping");
    }
  }

  if (!builder_.add_object_type(std::move(type))) {
    duplicate(doc["type"], key, fmt::format("duplicate object type '{}'", *name));
  }
}

// ============================================================================
// Actions
// ============================================================================

void DocumentParser::parse_action(const YAML::Node & doc)
{
  auto name = scalar(doc["action"], "action");
  if (!name) {
    return;
  }
  Action action;
  action.name = *name;
  if (doc["object_type"] && doc["object_type"].IsScalar()) {
    action.object_type = doc["object_type"].Scalar();
  }
  if (action.object_type == "generic") {
    action.object_type.clear();
  }
  if (doc["description"] && doc["description"].IsScalar()) {
    action.description = doc["description"].Scalar();
  }

  if (const YAML::Node params = doc["parameters"]) {
    if (!params.IsMap()) {
      malformed(params, "'parameters' must be a mapping");
      return;
    }
    for (const auto & entry : params) {
      ParameterSpec p;
      p.name = entry.first.as<std::string>();
      const YAML::Node body = entry.second;
      if (body.IsMap()) {
        if (body["type"] && body["type"].IsScalar()) {
          p.type = body["type"].Scalar();
        }
        if (body["choices"] && body["choices"].IsSequence()) {
          for (const auto & c : body["choices"]) {
            if (auto s = scalar(c, "choices")) {
              p.choices.push_back(normalize_scalar(*s));
            }
          }
        }
        if (body["required"] && body["required"].IsScalar()) {
          p.required = body["required"].as<bool>(true);
        }
      }
      action.parameters.push_back(std::move(p));
    }
  }

  auto pre = parse_conditions(doc["preconditions"]);
  auto eff = parse_effects(doc["effects"]);
  if (!pre || !eff) {
    return;
  }
  action.preconditions = std::move(*pre);
  action.effects = std::move(*eff);

  const std::string key =
    fmt::format("action:{}:{}", action.is_generic() ? "generic" : action.object_type, *name);
  origins_.emplace(key, loc(doc["action"]));
  if (!builder_.add_action(std::move(action))) {
    duplicate(doc["action"], key, fmt::format("duplicate action '{}'", *name));
  }
}

// ============================================================================
// Conditions and effects
// ============================================================================

std::optional<std::vector<Condition>> DocumentParser::parse_conditions(const YAML::Node & node)
{
  std::vector<Condition> out;
  if (!node || node.IsNull()) {
    return out;
  }
  if (node.IsMap()) {
    auto c = parse_condition(node);
    if (!c) {
      return std::nullopt;
    }
    out.push_back(std::move(*c));
    return out;
  }
  if (!node.IsSequence()) {
    malformed(node, "conditions must be a mapping or a list");
    return std::nullopt;
  }
  bool ok = true;
  for (const auto & item : node) {
    if (auto c = parse_condition(item)) {
      out.push_back(std::move(*c));
    } else {
      ok = false;
    }
  }
  if (!ok) {
    return std::nullopt;
  }
  return out;
}

std::optional<Condition> DocumentParser::parse_condition(const YAML::Node & node)
{
  if (!node || !node.IsMap()) {
    malformed(node, "condition must be a mapping");
    return std::nullopt;
  }
  auto kind = scalar(node["type"], "type");
  if (!kind) {
    return std::nullopt;
  }

  if (*kind == "attribute_check") {
    auto path = target(node["target"]);
    if (!path) {
      return std::nullopt;
    }
    const std::string op_text =
      node["operator"] && node["operator"].IsScalar() ? node["operator"].Scalar() : "equals";
    const auto op = parse_compare_op(op_text);
    if (!op) {
      malformed(node["operator"], fmt::format("unknown operator '{}'", op_text));
      return std::nullopt;
    }
    const YAML::Node value = node["value"];
    if (value && value.IsMap()) {
      auto ref_kind = scalar(value["type"], "type");
      auto ref_name = scalar(value["name"], "name");
      if (!ref_kind || !ref_name || *ref_kind != "parameter_ref") {
        malformed(value, "value mapping must be {type: parameter_ref, name: ...}");
        return std::nullopt;
      }
      return AttributeCheck{*path, *op, Operand{ParameterRef{*ref_name}}};
    }
    std::vector<std::string> levels;
    if (value && value.IsSequence()) {
      for (const auto & v : value) {
        if (auto s = scalar(v, "value")) {
          levels.push_back(normalize_scalar(*s));
        }
      }
    } else if (auto s = scalar(value, "value")) {
      levels.push_back(normalize_scalar(*s));
    } else {
      return std::nullopt;
    }
    return AttributeCheck{*path, *op, Operand{std::move(levels)}};
  }

  if (*kind == "parameter_valid") {
    auto param = scalar(node["parameter"], "parameter");
    if (!param) {
      return std::nullopt;
    }
    ParameterCheck c;
    c.parameter = *param;
    if (node["valid_values"] && node["valid_values"].IsSequence()) {
      for (const auto & v : node["valid_values"]) {
        if (auto s = scalar(v, "valid_values")) {
          c.valid_values.push_back(normalize_scalar(*s));
        }
      }
    }
    return c;
  }

  if (*kind == "parameter_equals") {
    auto param = scalar(node["parameter"], "parameter");
    auto value = scalar(node["value"], "value");
    if (!param || !value) {
      return std::nullopt;
    }
    return ParameterCheck{*param, {}, normalize_scalar(*value)};
  }

  if (*kind == "and" || *kind == "or") {
    const YAML::Node items = node["conditions"];
    if (!items || !items.IsSequence() || items.size() == 0) {
      malformed(node, fmt::format("'{}' needs a non-empty 'conditions' list", *kind));
      return std::nullopt;
    }
    auto parsed = parse_conditions(items);
    if (!parsed) {
      return std::nullopt;
    }
    return *kind == "and" ? all_of(std::move(*parsed)) : any_of(std::move(*parsed));
  }

  if (*kind == "not") {
    auto inner = parse_condition(node["condition"]);
    if (!inner) {
      return std::nullopt;
    }
    return negate(std::move(*inner));
  }

  if (*kind == "implication") {
    auto antecedent = parse_condition(node["if"]);
    auto consequent = parse_condition(node["then"]);
    if (!antecedent || !consequent) {
      return std::nullopt;
    }
    return implies(std::move(*antecedent), std::move(*consequent));
  }

  malformed(node["type"], fmt::format("unknown condition type '{}'", *kind));
  return std::nullopt;
}

std::optional<std::vector<Effect>> DocumentParser::parse_effects(const YAML::Node & node)
{
  std::vector<Effect> out;
  if (!node || node.IsNull()) {
    return out;
  }
  if (node.IsMap()) {
    auto e = parse_effect(node);
    if (!e) {
      return std::nullopt;
    }
    out.push_back(std::move(*e));
    return out;
  }
  if (!node.IsSequence()) {
    malformed(node, "effects must be a mapping or a list");
    return std::nullopt;
  }
  bool ok = true;
  for (const auto & item : node) {
    if (auto e = parse_effect(item)) {
      out.push_back(std::move(*e));
    } else {
      ok = false;
    }
  }
  if (!ok) {
    return std::nullopt;
  }
  return out;
}

std::optional<Effect> DocumentParser::parse_effect(const YAML::Node & node)
{
  if (!node || !node.IsMap()) {
    malformed(node, "effect must be a mapping");
    return std::nullopt;
  }
  auto kind = scalar(node["type"], "type");
  if (!kind) {
    return std::nullopt;
  }

  if (*kind == "set_attribute") {
    auto path = target(node["target"]);
    if (!path) {
      return std::nullopt;
    }
    const YAML::Node value = node["value"];
    if (value && value.IsMap()) {
      auto ref_name = scalar(value["name"], "name");
      if (!ref_name) {
        return std::nullopt;
      }
      return SetAttributeEffect{*path, ValueSource{ParameterRef{*ref_name}}};
    }
    auto s = scalar(value, "value");
    if (!s) {
      return std::nullopt;
    }
    return SetAttributeEffect{*path, ValueSource{normalize_scalar(*s)}};
  }

  if (*kind == "set_trend") {
    auto path = target(node["target"]);
    auto dir_text = scalar(node["direction"], "direction");
    if (!path || !dir_text) {
      return std::nullopt;
    }
    const auto dir = parse_trend(*dir_text);
    if (!dir) {
      malformed(node["direction"], fmt::format("trend must be up, down or none, got '{}'", *dir_text));
      return std::nullopt;
    }
    return SetTrendEffect{*path, *dir};
  }

  if (*kind == "conditional") {
    auto cond = parse_condition(node["condition"]);
    auto then_effects = parse_effects(node["then"]);
    if (!cond || !then_effects) {
      return std::nullopt;
    }
    std::optional<std::vector<Effect>> else_effects;
    if (node["else"]) {
      else_effects = parse_effects(node["else"]);
      if (!else_effects) {
        return std::nullopt;
      }
    }
    return when(std::move(*cond), std::move(*then_effects), std::move(else_effects));
  }

  malformed(node["type"], fmt::format("unknown effect type '{}'", *kind));
  return std::nullopt;
}

// ============================================================================
// Driver
// ============================================================================

KbLoadResult load_documents(std::vector<Document> documents, KbLoadResult result)
{
  KnowledgeBaseBuilder builder;

  auto pass = [&](const char * key, void (DocumentParser::*parse)(const YAML::Node &)) {
    for (const auto & d : documents) {
      if (d.root.IsMap() && d.root[key]) {
        DocumentParser parser(d.file, result.diagnostics, builder, result.origins);
        try {
          (parser.*parse)(d.root);
        } catch (const YAML::Exception & e) {
          result.diagnostics
            .report_error(
              KbLocation{d.file, static_cast<uint32_t>(e.mark.line + 1),
                         static_cast<uint32_t>(e.mark.column + 1)},
              fmt::format("invalid value: {}", e.msg))
            .with_code("K006");
        }
      }
    }
  };

  for (const auto & d : documents) {
    if (!d.root.IsMap() || (!d.root["spaces"] && !d.root["type"] && !d.root["action"])) {
      result.diagnostics
        .report_warning(
          KbLocation{d.file, 1, 1}, "document has no 'spaces', 'type' or 'action' key; ignored")
        .with_code("K006");
    }
  }

  pass("spaces", &DocumentParser::parse_spaces);
  pass("type", &DocumentParser::parse_object_type);
  pass("action", &DocumentParser::parse_action);

  result.kb = std::move(builder).build();
  validate_knowledge_base(result.kb, result.diagnostics, &result.origins);
  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace

KbLoadResult load_knowledge_base(const std::vector<KbSource> & sources)
{
  KbLoadResult result;
  std::vector<Document> documents;

  for (const auto & src : sources) {
    result.sources[src.name] = src.text;
    try {
      for (auto & root : YAML::LoadAll(src.text)) {
        if (!root.IsNull()) {
          documents.push_back(Document{src.name, std::move(root)});
        }
      }
    } catch (const YAML::ParserException & e) {
      result.diagnostics
        .report_error(
          KbLocation{src.name, static_cast<uint32_t>(e.mark.line + 1),
                     static_cast<uint32_t>(e.mark.column + 1)},
          fmt::format("failed to parse YAML: {}", e.msg))
        .with_code("K001");
    }
  }

  return load_documents(std::move(documents), std::move(result));
}

KbLoadResult load_knowledge_base_files(const std::vector<std::filesystem::path> & paths)
{
  namespace fs = std::filesystem;

  std::vector<KbSource> sources;
  DiagnosticBag io_errors;

  auto read = [&](const fs::path & p) {
    std::ifstream in(p);
    if (!in) {
      io_errors.report_error(KbLocation{p.string(), 0, 0}, "cannot read file").with_code("K001");
      return;
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    sources.push_back(KbSource{p.string(), ss.str()});
  };

  for (const auto & path : paths) {
    std::error_code ec;
    if (fs::is_regular_file(path, ec)) {
      read(path);
      continue;
    }
    if (!fs::is_directory(path, ec)) {
      io_errors
        .report_error(KbLocation{path.string(), 0, 0}, "knowledge base path does not exist")
        .with_code("K001");
      continue;
    }
    std::vector<fs::path> found;
    for (const auto & entry : fs::recursive_directory_iterator(path, ec)) {
      const auto ext = entry.path().extension();
      if (entry.is_regular_file() && (ext == ".yaml" || ext == ".yml")) {
        found.push_back(entry.path());
      }
    }
    std::sort(found.begin(), found.end());
    for (const auto & f : found) {
      read(f);
    }
  }

  KbLoadResult result = load_knowledge_base(sources);
  result.diagnostics.merge(std::move(io_errors));
  result.success = !result.diagnostics.has_errors();
  return result;
}

}  // namespace qualsim
