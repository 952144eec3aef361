// qualsim/model/effect.hpp - Postcondition effects
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "qualsim/basic/box.hpp"
#include "qualsim/model/attribute_path.hpp"
#include "qualsim/model/condition.hpp"

namespace qualsim
{

/// Level name, or a parameter whose value names a level.
using ValueSource = std::variant<std::string, ParameterRef>;

struct SetAttributeEffect
{
  AttributePath target;
  ValueSource value;
};

struct SetTrendEffect
{
  AttributePath target;
  Trend direction = Trend::None;
};

struct ConditionalEffect;

using Effect = std::variant<SetAttributeEffect, SetTrendEffect, Box<ConditionalEffect>>;

/**
 * if condition: then_effects else: else_effects.
 *
 * An absent else (std::nullopt) marks a required postcondition: reaching
 * it with a false condition is an error. An else that is present but empty
 * is a deliberate no-op. if/elif chains are written as an else holding a
 * single nested ConditionalEffect over the same attributes.
 */
struct ConditionalEffect
{
  Condition condition;
  std::vector<Effect> then_effects;
  std::optional<std::vector<Effect>> else_effects;

  /// The nested conditional when the else branch is an elif, else nullptr.
  [[nodiscard]] const ConditionalEffect * elif() const;
};

// ============================================================================
// Construction helpers
// ============================================================================

[[nodiscard]] Effect set_attribute(std::string_view path, std::string level);
[[nodiscard]] Effect set_attribute_from(std::string_view path, std::string parameter);
[[nodiscard]] Effect set_trend(std::string_view path, Trend direction);
[[nodiscard]] Effect when(
  Condition condition, std::vector<Effect> then_effects,
  std::optional<std::vector<Effect>> else_effects = std::nullopt);

[[nodiscard]] std::string describe(const Effect & effect);

}  // namespace qualsim
