#include "property_attributes.hpp"

#include "../helpers/helpers.hpp"
#include "type_decoder.hpp"
#include <string>

namespace parser {

using Kind = models::PropertyAttribute::Kind;

models::PropertyAttribute ParsePropertyAttribute(std::string_view item) {
  models::PropertyAttribute result{Kind::kOther, std::string(item),
                                   std::nullopt};
  if (item.empty()) {
    return result;
  }

  auto value = std::string(item.substr(1));
  switch (item.front()) {
  case 'T':
    result.kind = Kind::kType;
    result.value = value;
    result.type = Decode(value);
    break;
  case 'G':
    result.kind = Kind::kGetter;
    result.value = value;
    break;
  case 'S':
    result.kind = Kind::kSetter;
    result.value = value;
    break;
  case 'V':
    result.kind = Kind::kIvar;
    result.value = value;
    break;
  default:
    if (item.size() != 1) {
      break;
    }
    switch (item.front()) {
    case 'R':
      result.kind = Kind::kReadonly;
      break;
    case 'N':
      result.kind = Kind::kNonatomic;
      break;
    case 'D':
      result.kind = Kind::kDynamic;
      break;
    case 'C':
      result.kind = Kind::kCopy;
      break;
    case '&':
      result.kind = Kind::kRetain;
      break;
    case 'W':
      result.kind = Kind::kWeak;
      break;
    default:
      return result;
    }
    result.value.clear();
    break;
  }
  return result;
}

std::vector<models::PropertyAttribute>
ParsePropertyAttributes(std::string_view text) {
  std::vector<models::PropertyAttribute> result;
  if (text.empty()) {
    return result;
  }
  for (const auto &item : helpers::SplitTopLevel(text, ',')) {
    result.push_back(ParsePropertyAttribute(item));
  }
  return result;
}

} // namespace parser
