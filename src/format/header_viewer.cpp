#include "header_viewer.hpp"

#include "../helpers/helpers.hpp"
#include "../parser/type_decoder.hpp"
#include <fmt/core.h>

namespace format {

namespace {

// Receiver and _cmd precede the declared arguments.
constexpr std::size_t kImplicitArguments = 2;

std::string AppendName(const std::string &type, const std::string &name) {
  if (!type.empty() && type.back() == '*') {
    return type + name;
  }
  return fmt::format("{} {}", type, name);
}

} // namespace

std::string HeaderViewer::ViewMethod(const std::string &selector,
                                     const models::MethodSignature &signature,
                                     bool is_class_method) const {
  const char *prefix = is_class_method ? "+" : "-";
  auto return_type =
      declarations_.ViewForArgument(signature.return_value.Type());

  auto labels = helpers::Split(selector, ':');
  if (labels.empty() || selector.find(':') == std::string::npos) {
    return fmt::format("{} ({}){};", prefix, return_type, selector);
  }

  std::string result = fmt::format("{} ({})", prefix, return_type);
  for (std::size_t i = 0; i < labels.size(); i++) {
    auto index = i + kImplicitArguments;
    auto type = index < signature.arguments.size()
                    ? declarations_.ViewForArgument(
                          signature.arguments[index].Type())
                    : std::string("id");
    if (i > 0) {
      result += " ";
    }
    result += fmt::format("{}:({})arg{}", labels[i], type, i);
  }
  return result + ";";
}

std::string HeaderViewer::ViewProperty(
    const std::string &name,
    const std::vector<models::PropertyAttribute> &attributes,
    bool is_class_property) const {
  using Kind = models::PropertyAttribute::Kind;

  const auto *type_attribute =
      models::FindPropertyAttribute(attributes, Kind::kType);
  auto type =
      type_attribute && type_attribute->type
          ? *type_attribute->type
          : models::TypeNode::Primitive(models::TypeNode::Kind::kUnknown);
  auto type_string = declarations_.ViewForArgument(type);

  std::vector<std::string> items;
  if (is_class_property) {
    items.push_back("class");
  }
  if (const auto *getter =
          models::FindPropertyAttribute(attributes, Kind::kGetter)) {
    items.push_back(fmt::format("getter={}", getter->value));
  }
  if (const auto *setter =
          models::FindPropertyAttribute(attributes, Kind::kSetter)) {
    items.push_back(fmt::format("setter={}", setter->value));
  }
  if (models::HasPropertyAttribute(attributes, Kind::kReadonly)) {
    items.push_back("readonly");
  }
  if (models::HasPropertyAttribute(attributes, Kind::kWeak)) {
    items.push_back("weak");
  }
  if (models::HasPropertyAttribute(attributes, Kind::kCopy)) {
    items.push_back("copy");
  }
  if (models::HasPropertyAttribute(attributes, Kind::kRetain)) {
    items.push_back("retain");
  }
  if (models::HasPropertyAttribute(attributes, Kind::kNonatomic)) {
    items.push_back("nonatomic");
  }

  std::string result = "@property";
  if (!items.empty()) {
    result += "(";
    for (std::size_t i = 0; i < items.size(); i++) {
      result += i > 0 ? ", " + items[i] : items[i];
    }
    result += ")";
  }
  result += " " + AppendName(type_string, name) + ";";

  if (models::HasPropertyAttribute(attributes, Kind::kDynamic)) {
    result += fmt::format(" // @dynamic {}", name);
  }
  if (const auto *ivar =
          models::FindPropertyAttribute(attributes, Kind::kIvar)) {
    if (ivar->value == name) {
      result += fmt::format(" // @synthesize {}", ivar->value);
    } else {
      result += fmt::format(" // @synthesize {}={}", name, ivar->value);
    }
  }
  return result;
}

std::string HeaderViewer::ViewIvar(const std::string &name,
                                   const std::string &type_encoding) const {
  auto type = parser::Decode(type_encoding);
  if (!type) {
    return fmt::format("unknown {};", name);
  }
  switch (type->GetKind()) {
  case models::TypeNode::Kind::kBitField:
    return declarations_.ViewForHeader(
        models::Field::BitField(type->GetWidth(), name), name);
  case models::TypeNode::Kind::kChar:
  case models::TypeNode::Kind::kUChar:
    return declarations_.ViewForHeader(models::Field(*type, name), name);
  default:
    break;
  }
  return AppendName(declarations_.View(*type), name) + ";";
}

} // namespace format
