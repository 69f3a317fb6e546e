#include "type_node.hpp"

#include "../helpers/helpers.hpp"
#include "field.hpp"
#include <fmt/core.h>
#include <stdexcept>
#include <utility>

namespace models {

namespace {

struct PrimitiveEncoding {
  TypeNode::Kind kind;
  char value;
};

constexpr PrimitiveEncoding kPrimitiveEncodings[] = {
    {TypeNode::Kind::kClass, '#'},      {TypeNode::Kind::kSelector, ':'},
    {TypeNode::Kind::kChar, 'c'},       {TypeNode::Kind::kUChar, 'C'},
    {TypeNode::Kind::kShort, 's'},      {TypeNode::Kind::kUShort, 'S'},
    {TypeNode::Kind::kInt, 'i'},        {TypeNode::Kind::kUInt, 'I'},
    {TypeNode::Kind::kLong, 'l'},       {TypeNode::Kind::kULong, 'L'},
    {TypeNode::Kind::kLongLong, 'q'},   {TypeNode::Kind::kULongLong, 'Q'},
    {TypeNode::Kind::kInt128, 't'},     {TypeNode::Kind::kUInt128, 'T'},
    {TypeNode::Kind::kFloat, 'f'},      {TypeNode::Kind::kDouble, 'd'},
    {TypeNode::Kind::kLongDouble, 'D'}, {TypeNode::Kind::kBool, 'B'},
    {TypeNode::Kind::kVoid, 'v'},       {TypeNode::Kind::kVoidConst, '1'},
    {TypeNode::Kind::kVoidIn, '2'},     {TypeNode::Kind::kUnknown, '?'},
    {TypeNode::Kind::kCharPtr, '*'},    {TypeNode::Kind::kAtom, '%'},
};

std::optional<std::string> NormalizeAggregateName(
    std::optional<std::string> name) {
  if (name && (name->empty() || *name == "?")) {
    return std::nullopt;
  }
  return name;
}

std::string EncodeFields(const std::vector<Field> &fields) {
  std::string result;
  for (const auto &field : fields) {
    result += field.Encode();
  }
  return result;
}

} // namespace

TypeNode::TypeNode(Kind kind) : kind_(kind) {}

TypeNode::TypeNode(const TypeNode &other)
    : kind_(other.kind_), name_(other.name_),
      inner_(other.inner_ ? std::make_unique<TypeNode>(*other.inner_)
                          : nullptr),
      params_(other.params_), has_params_(other.has_params_),
      fields_(other.fields_), has_fields_(other.has_fields_),
      count_(other.count_), modifier_(other.modifier_) {}

TypeNode::TypeNode(TypeNode &&other) noexcept = default;

TypeNode &TypeNode::operator=(const TypeNode &other) {
  if (this == &other) {
    return *this;
  }
  TypeNode copy(other);
  *this = std::move(copy);
  return *this;
}

TypeNode &TypeNode::operator=(TypeNode &&other) noexcept = default;

TypeNode::~TypeNode() = default;

TypeNode TypeNode::Primitive(Kind kind) {
  if (!IsPrimitiveKind(kind)) {
    throw std::invalid_argument("TypeNode::Primitive expects a primitive kind");
  }
  return TypeNode(kind);
}

TypeNode TypeNode::Object(std::optional<std::string> class_name) {
  TypeNode node(Kind::kObject);
  node.name_ = std::move(class_name);
  return node;
}

TypeNode TypeNode::Block() { return TypeNode(Kind::kBlock); }

TypeNode TypeNode::Block(TypeNode return_type,
                         std::vector<TypeNode> param_types) {
  TypeNode node(Kind::kBlock);
  node.inner_ = std::make_unique<TypeNode>(std::move(return_type));
  node.params_ = std::move(param_types);
  node.has_params_ = true;
  return node;
}

TypeNode TypeNode::FunctionPointer() {
  return TypeNode(Kind::kFunctionPointer);
}

TypeNode TypeNode::Array(TypeNode element_type, std::optional<int> count) {
  TypeNode node(Kind::kArray);
  node.inner_ = std::make_unique<TypeNode>(std::move(element_type));
  node.count_ = count;
  return node;
}

TypeNode TypeNode::Pointer(TypeNode pointee) {
  TypeNode node(Kind::kPointer);
  node.inner_ = std::make_unique<TypeNode>(std::move(pointee));
  return node;
}

TypeNode TypeNode::BitField(int width) {
  TypeNode node(Kind::kBitField);
  node.count_ = width;
  return node;
}

TypeNode TypeNode::Struct(std::optional<std::string> name,
                          std::optional<std::vector<Field>> fields) {
  TypeNode node(Kind::kStruct);
  node.name_ = NormalizeAggregateName(std::move(name));
  if (fields) {
    node.fields_ = std::move(*fields);
    node.has_fields_ = true;
  }
  return node;
}

TypeNode TypeNode::Union(std::optional<std::string> name,
                         std::optional<std::vector<Field>> fields) {
  TypeNode node = Struct(std::move(name), std::move(fields));
  node.kind_ = Kind::kUnion;
  return node;
}

TypeNode TypeNode::Modified(Modifier modifier, TypeNode inner) {
  TypeNode node(Kind::kModified);
  node.modifier_ = modifier;
  node.inner_ = std::make_unique<TypeNode>(std::move(inner));
  return node;
}

TypeNode TypeNode::Other(std::string raw) {
  TypeNode node(Kind::kOther);
  node.name_ = std::move(raw);
  return node;
}

std::optional<TypeNode> TypeNode::FromPrimitiveEncoding(char value) {
  if (value == '@') {
    return Object();
  }
  for (const auto &entry : kPrimitiveEncodings) {
    if (entry.value == value) {
      return TypeNode(entry.kind);
    }
  }
  return std::nullopt;
}

bool TypeNode::IsPrimitiveKind(Kind kind) {
  for (const auto &entry : kPrimitiveEncodings) {
    if (entry.kind == kind) {
      return true;
    }
  }
  return false;
}

std::string TypeNode::GetRaw() const {
  if (kind_ != Kind::kOther) {
    return "";
  }
  return name_.value_or("");
}

const std::vector<TypeNode> *TypeNode::GetParamTypes() const {
  return has_params_ ? &params_ : nullptr;
}

const std::vector<Field> *TypeNode::GetFields() const {
  return has_fields_ ? &fields_ : nullptr;
}

std::string TypeNode::Encode() const {
  for (const auto &entry : kPrimitiveEncodings) {
    if (entry.kind == kind_) {
      return std::string(1, entry.value);
    }
  }

  switch (kind_) {
  case Kind::kObject:
    return name_ ? fmt::format("@\"{}\"", helpers::EscapeQuoted(*name_))
                 : "@";
  case Kind::kBlock: {
    if (!inner_ || !has_params_) {
      return "@?";
    }
    std::string params;
    for (const auto &param : params_) {
      params += param.Encode();
    }
    return fmt::format("@?<{}@?{}>", inner_->Encode(), params);
  }
  case Kind::kFunctionPointer:
    return "^?";
  case Kind::kArray:
    return fmt::format("[{}{}]", count_ ? std::to_string(*count_) : "",
                       inner_->Encode());
  case Kind::kPointer:
    return "^" + inner_->Encode();
  case Kind::kBitField:
    return fmt::format("b{}", count_.value_or(0));
  case Kind::kUnion:
    if (!has_fields_) {
      return fmt::format("({})", name_.value_or("?"));
    }
    return fmt::format("({}={})", name_.value_or("?"), EncodeFields(fields_));
  case Kind::kStruct:
    if (!has_fields_) {
      return fmt::format("{{{}}}", name_.value_or("?"));
    }
    return fmt::format("{{{}={}}}", name_.value_or("?"), EncodeFields(fields_));
  case Kind::kModified:
    return EncodeModifier(modifier_) + inner_->Encode();
  case Kind::kOther:
    return name_.value_or("");
  default:
    break;
  }
  return "?";
}

bool TypeNode::operator==(const TypeNode &other) const {
  if (kind_ != other.kind_ || name_ != other.name_ ||
      count_ != other.count_ || has_params_ != other.has_params_ ||
      has_fields_ != other.has_fields_) {
    return false;
  }
  if (kind_ == Kind::kModified && modifier_ != other.modifier_) {
    return false;
  }
  if ((inner_ == nullptr) != (other.inner_ == nullptr)) {
    return false;
  }
  if (inner_ && *inner_ != *other.inner_) {
    return false;
  }
  return params_ == other.params_ && fields_ == other.fields_;
}

} // namespace models
