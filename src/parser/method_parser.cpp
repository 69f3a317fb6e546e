#include "method_parser.hpp"

#include <utility>

namespace parser {

MethodSignatureParser::MethodSignatureParser(std::string_view encoding)
    : cursor_(encoding) {}

models::MethodSignature MethodSignatureParser::Parse() {
  models::MethodSignature result;
  result.return_value.type_encoding = PopType();
  result.stack_size = PopInt();

  while (!cursor_.AtEnd()) {
    auto start = cursor_.Position();
    models::MethodValue argument;
    argument.type_encoding = PopType();
    argument.offset = PopInt();
    if (cursor_.Position() == start) {
      break;
    }
    result.arguments.push_back(std::move(argument));
  }
  return result;
}

std::string MethodSignatureParser::PopType() {
  return std::string(cursor_.SkipOneType());
}

std::optional<int> MethodSignatureParser::PopInt() { return cursor_.ReadInt(); }

models::MethodSignature ParseMethodSignature(std::string_view encoding) {
  MethodSignatureParser parser(encoding);
  return parser.Parse();
}

} // namespace parser
