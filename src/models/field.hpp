#pragma once

#include "type_node.hpp"

#include <optional>
#include <string>

namespace models {

/**
 * @struct Field
 * @brief One member of a struct or union.
 */
struct Field {
  TypeNode type;                   /**< The member type. */
  std::optional<std::string> name; /**< The member name, if encoded. */
  std::optional<int> bit_width;    /**< The width of a bit-field member. */

  explicit Field(TypeNode type, std::optional<std::string> name = std::nullopt,
                 std::optional<int> bit_width = std::nullopt);

  /**
   * @brief Creates a bit-field member.
   * @param width The width in bits.
   * @param name The member name, if any.
   * @return An `int` member with the given width.
   */
  static Field BitField(int width,
                        std::optional<std::string> name = std::nullopt);

  bool IsBitField() const { return bit_width.has_value(); }

  /**
   * @brief Serializes the member as it appears inside a struct encoding.
   * @return `"name"type`, `type`, `"name"b<width>` or `b<width>`.
   */
  std::string Encode() const;

  bool operator==(const Field &other) const;
  bool operator!=(const Field &other) const { return !(*this == other); }
};

} // namespace models
