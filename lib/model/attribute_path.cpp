// qualsim/model/attribute_path.cpp
#include "qualsim/model/attribute_path.hpp"

#include <utility>

namespace qualsim
{

AttributePath::AttributePath(std::string part, std::string attribute)
: part_(std::move(part)), attribute_(std::move(attribute))
{
}

std::optional<AttributePath> AttributePath::parse(std::string_view text)
{
  if (text.empty()) {
    return std::nullopt;
  }
  const size_t dot = text.find('.');
  if (dot == std::string_view::npos) {
    return AttributePath{"", std::string(text)};
  }
  const std::string_view part = text.substr(0, dot);
  const std::string_view attr = text.substr(dot + 1);
  if (part.empty() || attr.empty() || attr.find('.') != std::string_view::npos) {
    return std::nullopt;
  }
  return AttributePath{std::string(part), std::string(attr)};
}

std::string AttributePath::str() const
{
  if (part_.empty()) {
    return attribute_;
  }
  return part_ + "." + attribute_;
}

}  // namespace qualsim
