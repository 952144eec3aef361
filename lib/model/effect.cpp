// qualsim/model/effect.cpp
#include "qualsim/model/effect.hpp"

#include <fmt/core.h>

#include <type_traits>
#include <utility>

namespace qualsim
{

namespace
{

template <typename>
inline constexpr bool always_false_v = false;

std::string describe_list(const std::vector<Effect> & effects)
{
  std::string out;
  for (size_t i = 0; i < effects.size(); ++i) {
    if (i > 0) {
      out += "; ";
    }
    out += describe(effects[i]);
  }
  return out;
}

}  // namespace

const ConditionalEffect * ConditionalEffect::elif() const
{
  if (!else_effects || else_effects->size() != 1) {
    return nullptr;
  }
  const auto * nested = std::get_if<Box<ConditionalEffect>>(&else_effects->front());
  return nested != nullptr ? nested->get() : nullptr;
}

Effect set_attribute(std::string_view path, std::string level)
{
  return SetAttributeEffect{
    AttributePath::parse(path).value_or(AttributePath{}), ValueSource{std::move(level)}};
}

Effect set_attribute_from(std::string_view path, std::string parameter)
{
  return SetAttributeEffect{
    AttributePath::parse(path).value_or(AttributePath{}),
    ValueSource{ParameterRef{std::move(parameter)}}};
}

Effect set_trend(std::string_view path, Trend direction)
{
  return SetTrendEffect{AttributePath::parse(path).value_or(AttributePath{}), direction};
}

Effect when(
  Condition condition, std::vector<Effect> then_effects,
  std::optional<std::vector<Effect>> else_effects)
{
  return Box<ConditionalEffect>(
    ConditionalEffect{std::move(condition), std::move(then_effects), std::move(else_effects)});
}

std::string describe(const Effect & effect)
{
  return std::visit(
    [](const auto & e) -> std::string {
      using T = std::decay_t<decltype(e)>;
      if constexpr (std::is_same_v<T, SetAttributeEffect>) {
        if (const auto * ref = std::get_if<ParameterRef>(&e.value)) {
          return fmt::format("{} := ${}", e.target.str(), ref->name);
        }
        return fmt::format("{} := {}", e.target.str(), std::get<std::string>(e.value));
      } else if constexpr (std::is_same_v<T, SetTrendEffect>) {
        return fmt::format("{} trend := {}", e.target.str(), to_string(e.direction));
      } else if constexpr (std::is_same_v<T, Box<ConditionalEffect>>) {
        std::string out =
          fmt::format("if {} then [{}]", describe(e->condition), describe_list(e->then_effects));
        if (e->else_effects) {
          out += fmt::format(" else [{}]", describe_list(*e->else_effects));
        }
        return out;
      } else {
        static_assert(always_false_v<T>, "unhandled effect kind");
      }
    },
    effect);
}

}  // namespace qualsim
