// qualsim/model/attribute_path.hpp - "part.attribute" identifiers
#pragma once

#include <compare>
#include <optional>
#include <string>
#include <string_view>

namespace qualsim
{

/**
 * Identifies one attribute of an object.
 *
 * Part attributes are written "part.attribute"; global attributes have an
 * empty part and are written as the bare attribute name.
 */
class AttributePath
{
public:
  AttributePath() = default;
  AttributePath(std::string part, std::string attribute);

  /// Parses "part.attr" or "attr". Empty segments are rejected.
  [[nodiscard]] static std::optional<AttributePath> parse(std::string_view text);

  [[nodiscard]] const std::string & part() const noexcept { return part_; }
  [[nodiscard]] const std::string & attribute() const noexcept { return attribute_; }
  [[nodiscard]] bool is_global() const noexcept { return part_.empty(); }
  [[nodiscard]] bool empty() const noexcept { return attribute_.empty(); }

  [[nodiscard]] std::string str() const;

  friend bool operator==(const AttributePath &, const AttributePath &) = default;
  friend std::strong_ordering operator<=>(const AttributePath &, const AttributePath &) = default;

private:
  std::string part_;
  std::string attribute_;
};

}  // namespace qualsim
