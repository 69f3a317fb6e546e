#include "type_decoder.hpp"

#include <string>
#include <vector>

namespace parser {

namespace {

using models::Field;
using models::TypeNode;

std::optional<TypeNode> DecodeBlock(Cursor &cursor) {
  cursor.Advance(2);
  if (cursor.Peek() != '<') {
    return TypeNode::Block();
  }

  auto content = cursor.ReadBracket('<', '>');
  if (!content) {
    return std::nullopt;
  }

  Cursor signature(*content);
  auto return_type = DecodeType(signature);
  if (!return_type || !signature.StartsWith("@?")) {
    return std::nullopt;
  }
  signature.Advance(2);

  std::vector<TypeNode> param_types;
  while (!signature.AtEnd()) {
    auto param = DecodeType(signature);
    if (!param) {
      return std::nullopt;
    }
    param_types.push_back(std::move(*param));
  }
  return TypeNode::Block(std::move(*return_type), std::move(param_types));
}

std::optional<TypeNode> DecodeObject(Cursor &cursor) {
  cursor.Advance();
  auto name = cursor.ReadQuoted();
  if (!name) {
    return std::nullopt;
  }
  return TypeNode::Object(std::move(*name));
}

std::optional<TypeNode> DecodeBitField(Cursor &cursor) {
  cursor.Advance();
  auto width = cursor.ReadInt();
  if (!width) {
    return std::nullopt;
  }
  return TypeNode::BitField(*width);
}

std::optional<TypeNode> DecodeArray(Cursor &cursor) {
  auto content = cursor.ReadBracket('[', ']');
  if (!content) {
    return std::nullopt;
  }

  Cursor element(*content);
  std::optional<int> count;
  if (auto digits = element.ReadDigits()) {
    Cursor number(*digits);
    count = number.ReadInt();
    if (!count) {
      return std::nullopt;
    }
  }

  auto element_type = DecodeType(element);
  if (!element_type || !element.AtEnd()) {
    return std::nullopt;
  }
  return TypeNode::Array(std::move(*element_type), count);
}

std::optional<TypeNode> DecodePointer(Cursor &cursor) {
  cursor.Advance();
  auto pointee = DecodeType(cursor);
  if (!pointee) {
    return std::nullopt;
  }
  return TypeNode::Pointer(std::move(*pointee));
}

std::optional<TypeNode> DecodeAggregate(Cursor &cursor, TypeNode::Kind kind) {
  bool is_union = kind == TypeNode::Kind::kUnion;
  auto content =
      is_union ? cursor.ReadBracket('(', ')') : cursor.ReadBracket('{', '}');
  if (!content) {
    return std::nullopt;
  }

  std::optional<std::string> name;
  std::optional<std::vector<Field>> fields;

  auto equal = content->find('=');
  if (equal == std::string_view::npos) {
    name = std::string(*content);
  } else {
    name = std::string(content->substr(0, equal));
    fields.emplace();

    Cursor members(content->substr(equal + 1));
    while (!members.AtEnd()) {
      auto field = DecodeField(members);
      if (!field) {
        return std::nullopt;
      }
      fields->push_back(std::move(*field));
    }
  }

  if (is_union) {
    return TypeNode::Union(std::move(name), std::move(fields));
  }
  return TypeNode::Struct(std::move(name), std::move(fields));
}

std::optional<int> DecodeBitWidth(Cursor &cursor) {
  cursor.Advance();
  return cursor.ReadInt();
}

} // namespace

std::optional<TypeNode> Decode(std::string_view text) {
  Cursor cursor(text);
  return DecodeType(cursor);
}

std::optional<std::pair<TypeNode, std::string_view>>
DecodeWithRemainder(std::string_view text) {
  Cursor cursor(text);
  auto node = DecodeType(cursor);
  if (!node) {
    return std::nullopt;
  }
  return std::make_pair(std::move(*node), cursor.Rest());
}

std::optional<TypeNode> DecodeType(Cursor &cursor) {
  if (cursor.AtEnd()) {
    return std::nullopt;
  }

  if (cursor.StartsWith("@?")) {
    return DecodeBlock(cursor);
  }
  if (cursor.StartsWith("@\"")) {
    return DecodeObject(cursor);
  }
  if (cursor.StartsWith("^?")) {
    cursor.Advance(2);
    return TypeNode::FunctionPointer();
  }

  char first = cursor.Peek();
  if (auto primitive = TypeNode::FromPrimitiveEncoding(first)) {
    cursor.Advance();
    return primitive;
  }

  if (auto modifier = models::ParseModifier(first)) {
    cursor.Advance();
    auto inner = DecodeType(cursor);
    if (!inner) {
      return std::nullopt;
    }
    return TypeNode::Modified(*modifier, std::move(*inner));
  }

  switch (first) {
  case 'b':
    return DecodeBitField(cursor);
  case '[':
    return DecodeArray(cursor);
  case '^':
    return DecodePointer(cursor);
  case '(':
    return DecodeAggregate(cursor, TypeNode::Kind::kUnion);
  case '{':
    return DecodeAggregate(cursor, TypeNode::Kind::kStruct);
  default:
    break;
  }
  return std::nullopt;
}

std::optional<Field> DecodeField(Cursor &cursor) {
  std::optional<std::string> name;
  if (cursor.Peek() == '"') {
    auto quoted = cursor.ReadQuoted();
    if (!quoted) {
      return std::nullopt;
    }
    name = std::move(*quoted);
  }

  if (cursor.Peek() == 'b') {
    auto width = DecodeBitWidth(cursor);
    if (!width) {
      return std::nullopt;
    }
    return Field::BitField(*width, std::move(name));
  }

  auto type = DecodeType(cursor);
  if (!type) {
    return std::nullopt;
  }
  return Field(std::move(*type), std::move(name));
}

} // namespace parser
