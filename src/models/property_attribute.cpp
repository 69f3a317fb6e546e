#include "property_attribute.hpp"

namespace models {

std::string PropertyAttribute::Encode() const {
  switch (kind) {
  case Kind::kType:
    return "T" + (type ? type->Encode() : value);
  case Kind::kReadonly:
    return "R";
  case Kind::kNonatomic:
    return "N";
  case Kind::kDynamic:
    return "D";
  case Kind::kCopy:
    return "C";
  case Kind::kRetain:
    return "&";
  case Kind::kWeak:
    return "W";
  case Kind::kGetter:
    return "G" + value;
  case Kind::kSetter:
    return "S" + value;
  case Kind::kIvar:
    return "V" + value;
  case Kind::kOther:
    return value;
  }
  return value;
}

std::string EncodePropertyAttributes(
    const std::vector<PropertyAttribute> &attributes) {
  std::string result;
  for (std::size_t i = 0; i < attributes.size(); i++) {
    if (i > 0) {
      result += ",";
    }
    result += attributes[i].Encode();
  }
  return result;
}

const PropertyAttribute *
FindPropertyAttribute(const std::vector<PropertyAttribute> &attributes,
                      PropertyAttribute::Kind kind) {
  for (const auto &attribute : attributes) {
    if (attribute.kind == kind) {
      return &attribute;
    }
  }
  return nullptr;
}

bool HasPropertyAttribute(const std::vector<PropertyAttribute> &attributes,
                          PropertyAttribute::Kind kind) {
  return FindPropertyAttribute(attributes, kind) != nullptr;
}

} // namespace models
