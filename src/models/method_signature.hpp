#pragma once

#include "type_node.hpp"

#include <optional>
#include <string>
#include <vector>

namespace models {

/**
 * @struct MethodValue
 * @brief The return value or one argument of a method signature.
 *
 * The type is kept as the raw encoding; it is decoded only on request.
 */
struct MethodValue {
  std::string type_encoding; /**< The undecoded type encoding. */
  std::optional<int> offset; /**< The stack offset, if encoded. */

  /**
   * @brief Decodes the type encoding.
   * @return The type, or std::nullopt if the encoding is malformed.
   */
  std::optional<TypeNode> Decode() const;

  /**
   * @brief Decodes the type encoding, falling back to the unknown type.
   * @return The type.
   */
  TypeNode Type() const;

  /**
   * @brief Serializes the value as it appears in a method signature.
   * @return The type encoding followed by the offset, if any.
   */
  std::string Encode() const;

  bool operator==(const MethodValue &other) const {
    return type_encoding == other.type_encoding && offset == other.offset;
  }
  bool operator!=(const MethodValue &other) const { return !(*this == other); }
};

/**
 * @struct MethodSignature
 * @brief A method type encoding split into its return value and arguments.
 */
struct MethodSignature {
  MethodValue return_value;          /**< The return value. */
  std::vector<MethodValue> arguments; /**< The arguments, receiver first. */
  std::optional<int> stack_size;     /**< The total argument frame size. */

  /**
   * @brief Serializes the signature back to a method type encoding.
   * @return The encoding.
   */
  std::string Encode() const;

  bool operator==(const MethodSignature &other) const {
    return return_value == other.return_value &&
           arguments == other.arguments && stack_size == other.stack_size;
  }
  bool operator!=(const MethodSignature &other) const {
    return !(*this == other);
  }
};

} // namespace models
