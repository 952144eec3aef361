// qualsim/io/kb_loader.hpp - Knowledge base loading from YAML
//
// Documents are classified by their top-level key:
//   spaces:  list of {id, name, levels}
//   type:    object type with parts, global_attributes, constraints, behaviors
//   action:  action with object_type, parameters, preconditions, effects
//
#pragma once

#include <filesystem>
#include <string>
#include <vector>

#include "qualsim/basic/diagnostic.hpp"
#include "qualsim/basic/diagnostic_printer.hpp"
#include "qualsim/io/kb_validator.hpp"
#include "qualsim/model/knowledge_base.hpp"

namespace qualsim
{

/// One YAML text with the name diagnostics should show for it.
struct KbSource
{
  std::string name;
  std::string text;
};

/**
 * Result of loading a knowledge base.
 *
 * `kb` holds everything that parsed even when `success` is false, so
 * callers may still describe a partially broken knowledge base.
 */
struct KbLoadResult
{
  KnowledgeBase kb;
  bool success = false;
  DiagnosticBag diagnostics;
  SourceTexts sources;  ///< for DiagnosticPrinter snippets
  KbOrigins origins;
};

/**
 * Load and validate YAML documents given as text.
 */
[[nodiscard]] KbLoadResult load_knowledge_base(const std::vector<KbSource> & sources);

/**
 * Load every *.yaml / *.yml file under @p paths (files or directories,
 * searched recursively in sorted order).
 */
[[nodiscard]] KbLoadResult load_knowledge_base_files(
  const std::vector<std::filesystem::path> & paths);

}  // namespace qualsim
