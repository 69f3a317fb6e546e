#pragma once

#include "../models/property_attribute.hpp"

#include <string_view>
#include <vector>

namespace parser {

/**
 * @brief Parses one attribute item.
 * @param item The item text, e.g. `T@"NSString"` or `V_name`.
 * @return The attribute. Unrecognized items are kept as kOther.
 */
models::PropertyAttribute ParsePropertyAttribute(std::string_view item);

/**
 * @brief Parses a runtime property attribute string.
 *
 * Items are separated by commas outside quotes and brackets. An empty
 * string has no attributes.
 *
 * @param text The attribute string, e.g. `T@"NSString",C,N,V_name`.
 * @return The attributes, in order.
 */
std::vector<models::PropertyAttribute>
ParsePropertyAttributes(std::string_view text);

} // namespace parser
