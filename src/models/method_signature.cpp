#include "method_signature.hpp"

#include "../parser/type_decoder.hpp"
#include <utility>

namespace models {

std::optional<TypeNode> MethodValue::Decode() const {
  return parser::Decode(type_encoding);
}

TypeNode MethodValue::Type() const {
  if (auto type = Decode()) {
    return std::move(*type);
  }
  return TypeNode::Primitive(TypeNode::Kind::kUnknown);
}

std::string MethodValue::Encode() const {
  return offset ? type_encoding + std::to_string(*offset) : type_encoding;
}

std::string MethodSignature::Encode() const {
  std::string result = return_value.type_encoding;
  if (stack_size) {
    result += std::to_string(*stack_size);
  }
  for (const auto &argument : arguments) {
    result += argument.Encode();
  }
  return result;
}

} // namespace models
