#include "field.hpp"

#include "../helpers/helpers.hpp"
#include <fmt/core.h>
#include <utility>

namespace models {

Field::Field(TypeNode type, std::optional<std::string> name,
             std::optional<int> bit_width)
    : type(std::move(type)), name(std::move(name)), bit_width(bit_width) {}

Field Field::BitField(int width, std::optional<std::string> name) {
  return Field(TypeNode::Primitive(TypeNode::Kind::kInt), std::move(name),
               width);
}

std::string Field::Encode() const {
  std::string prefix =
      name ? fmt::format("\"{}\"", helpers::EscapeQuoted(*name)) : "";
  if (bit_width) {
    return fmt::format("{}b{}", prefix, *bit_width);
  }
  return prefix + type.Encode();
}

bool Field::operator==(const Field &other) const {
  return type == other.type && name == other.name &&
         bit_width == other.bit_width;
}

} // namespace models
