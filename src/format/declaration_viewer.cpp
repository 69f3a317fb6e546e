#include "declaration_viewer.hpp"

#include "../helpers/helpers.hpp"
#include <fmt/core.h>
#include <utility>

namespace format {

using Kind = models::TypeNode::Kind;

DeclarationViewer::DeclarationViewer(std::string tab) : tab_(std::move(tab)) {}

std::string DeclarationViewer::View(const models::TypeNode &node) const {
  switch (node.GetKind()) {
  case Kind::kClass:
    return "Class";
  case Kind::kSelector:
    return "SEL";
  case Kind::kChar:
    return "char";
  case Kind::kUChar:
    return "unsigned char";
  case Kind::kShort:
    return "short";
  case Kind::kUShort:
    return "unsigned short";
  case Kind::kInt:
    return "int";
  case Kind::kUInt:
    return "unsigned int";
  case Kind::kLong:
    return "long";
  case Kind::kULong:
    return "unsigned long";
  case Kind::kLongLong:
    return "long long";
  case Kind::kULongLong:
    return "unsigned long long";
  case Kind::kInt128:
    return "__int128_t";
  case Kind::kUInt128:
    return "__uint128_t";
  case Kind::kFloat:
    return "float";
  case Kind::kDouble:
    return "double";
  case Kind::kLongDouble:
    return "long double";
  case Kind::kBool:
    return "BOOL";
  case Kind::kVoid:
  case Kind::kVoidConst:
  case Kind::kVoidIn:
    return "void";
  case Kind::kUnknown:
    return "unknown";
  case Kind::kCharPtr:
    return "char *";
  case Kind::kAtom:
    return "atom";
  case Kind::kObject: {
    const auto &name = node.GetName();
    if (!name) {
      return "id";
    }
    if (name->size() >= 2 && name->front() == '<' && name->back() == '>') {
      return fmt::format("id {}", *name);
    }
    return fmt::format("{} *", *name);
  }
  case Kind::kBlock: {
    const auto *params = node.GetParamTypes();
    if (node.GetInner() == nullptr || params == nullptr) {
      return "id /* block */";
    }
    std::string args;
    for (const auto &param : *params) {
      if (!args.empty()) {
        args += ", ";
      }
      args += View(param);
    }
    return fmt::format("{} (^)({})", View(*node.GetInner()), args);
  }
  case Kind::kFunctionPointer:
    return "void * /* function pointer */";
  case Kind::kArray: {
    auto count = node.GetCount();
    return fmt::format("{}[{}]", View(*node.GetInner()),
                       count ? std::to_string(*count) : "");
  }
  case Kind::kPointer:
    return fmt::format("{} *", View(*node.GetInner()));
  case Kind::kBitField:
    return fmt::format("int x : {}", node.GetWidth());
  case Kind::kUnion:
  case Kind::kStruct:
    return ViewAggregate(node);
  case Kind::kModified:
    return fmt::format("{} {}", models::ModifierKeyword(node.GetModifier()),
                       View(*node.GetInner()));
  case Kind::kOther:
    return node.GetRaw();
  }
  return "unknown";
}

std::string DeclarationViewer::View(const models::Field &field,
                                    const std::string &fallback_name) const {
  const auto &name = field.name ? *field.name : fallback_name;
  if (field.bit_width) {
    return fmt::format("{} {} : {};", View(field.type), name, *field.bit_width);
  }
  return fmt::format("{} {};", View(field.type), name);
}

std::string
DeclarationViewer::ViewFields(const std::vector<models::Field> &fields) const {
  std::string result;
  for (std::size_t i = 0; i < fields.size(); i++) {
    if (i > 0) {
      result += "\n";
    }
    result +=
        helpers::IndentLines(View(fields[i], fmt::format("x{}", i)), tab_);
  }
  return result;
}

std::string
DeclarationViewer::ViewForArgument(const models::TypeNode &node) const {
  if (node.IsAggregate() && node.GetName()) {
    return *node.GetName();
  }
  // BOOL is encoded as a signed char on most targets.
  if (node.GetKind() == Kind::kChar) {
    return "BOOL";
  }
  DeclarationViewer flat("");
  return helpers::JoinLines(flat.View(node), " ");
}

std::string DeclarationViewer::ViewForHeader(
    const models::Field &field, const std::string &fallback_name) const {
  auto kind = field.type.GetKind();
  if (!field.bit_width && (kind == Kind::kChar || kind == Kind::kUChar)) {
    return fmt::format("BOOL {};", field.name ? *field.name : fallback_name);
  }
  return View(field, fallback_name);
}

std::string
DeclarationViewer::ViewAggregate(const models::TypeNode &node) const {
  const char *kind = node.GetKind() == Kind::kUnion ? "union" : "struct";
  const auto &name = node.GetName();
  const auto *fields = node.GetFields();

  if (fields == nullptr || fields->empty()) {
    return fmt::format("{} {}", kind, name ? *name : "{}");
  }
  return fmt::format("{}{}{{\n{}\n}}", kind,
                     name ? fmt::format(" {} ", *name) : " ",
                     ViewFields(*fields));
}

} // namespace format
