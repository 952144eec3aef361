// qualsim/io/kb_validator.hpp - Semantic checks over a loaded knowledge base
#pragma once

#include <map>
#include <string>

#include "qualsim/basic/diagnostic.hpp"
#include "qualsim/model/knowledge_base.hpp"

namespace qualsim
{

/**
 * Where each definition was read from, used to anchor diagnostics.
 *
 * Keys: "type:<name>", "action:<object type or generic>:<name>",
 * "behavior:<type>:<action>", "constraint:<type>:<index>".
 */
using KbOrigins = std::map<std::string, KbLocation>;

/**
 * Checks everything that needs the complete knowledge base:
 *  - K003 levels named in conditions and effects exist in the space;
 *  - K004 every attribute path exists on the object type;
 *  - K006 ordered operators compare against exactly one level;
 *  - K007 nested conditionals only read their enclosing attributes;
 *  - K008 effects never write immutable attributes;
 *  - K009 parameter references name a declared parameter.
 *
 * Generic actions are checked against every object type that declares
 * the attributes they touch.
 */
void validate_knowledge_base(
  const KnowledgeBase & kb, DiagnosticBag & diags, const KbOrigins * origins = nullptr);

}  // namespace qualsim
