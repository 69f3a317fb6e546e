#pragma once

#include "../models/field.hpp"
#include "../models/type_node.hpp"
#include "cursor.hpp"

#include <optional>
#include <string_view>
#include <utility>

namespace parser {

/**
 * @brief Decodes the first type description of a type encoding.
 *
 * Text after the first complete type is ignored.
 *
 * @param text The type encoding.
 * @return The decoded type, or std::nullopt if the text does not begin with
 * a well-formed type.
 */
std::optional<models::TypeNode> Decode(std::string_view text);

/**
 * @brief Decodes the first type description and reports what follows it.
 * @param text The type encoding.
 * @return The decoded type and the unread remainder of @p text, or
 * std::nullopt if the text does not begin with a well-formed type.
 */
std::optional<std::pair<models::TypeNode, std::string_view>>
DecodeWithRemainder(std::string_view text);

/**
 * @brief Decodes one type at the cursor.
 *
 * On success the cursor is left just after the type. On failure the cursor
 * position is unspecified and the caller should discard it.
 *
 * @param cursor The read position.
 * @return The decoded type, or std::nullopt.
 */
std::optional<models::TypeNode> DecodeType(Cursor &cursor);

/**
 * @brief Decodes one struct or union member at the cursor.
 *
 * A member is an optional quoted name followed by a bit-field or a type.
 *
 * @param cursor The read position.
 * @return The decoded member, or std::nullopt.
 */
std::optional<models::Field> DecodeField(Cursor &cursor);

} // namespace parser
