#pragma once

#include "../models/method_signature.hpp"
#include "cursor.hpp"

#include <optional>
#include <string>
#include <string_view>

namespace parser {

/**
 * @class MethodSignatureParser
 * @brief Splits a method type encoding into raw types and offsets.
 *
 * The parser only finds type boundaries; it never builds TypeNode trees.
 * Callers decode the individual values on demand.
 */
class MethodSignatureParser {
public:
  /**
   * @brief Constructs a parser over a method type encoding.
   * @param encoding The encoding, e.g. "v20@0:8@16". It must outlive the
   * parser.
   */
  explicit MethodSignatureParser(std::string_view encoding);

  /**
   * @brief Runs the scan.
   *
   * The return type comes first, then the optional stack size, then
   * type/offset pairs until the input is exhausted. Malformed trailing input
   * ends the scan.
   *
   * @return The split signature.
   */
  models::MethodSignature Parse();

private:
  /**
   * @brief Consumes one top-level type.
   * @return The raw type encoding, empty at the end of the input.
   */
  std::string PopType();

  /**
   * @brief Consumes a run of decimal digits.
   * @return The number, or std::nullopt if there are no digits.
   */
  std::optional<int> PopInt();

  Cursor cursor_;
};

/**
 * @brief Splits a method type encoding.
 * @param encoding The encoding.
 * @return The split signature.
 */
models::MethodSignature ParseMethodSignature(std::string_view encoding);

} // namespace parser
