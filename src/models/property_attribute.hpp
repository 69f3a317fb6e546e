#pragma once

#include "type_node.hpp"

#include <optional>
#include <string>
#include <vector>

namespace models {

/**
 * @struct PropertyAttribute
 * @brief One item of a runtime property attribute string.
 */
struct PropertyAttribute {
  /**
   * @enum Kind
   * @brief The attribute, keyed by its leading character.
   */
  enum class Kind {
    kType,      /**< `T<encoding>` */
    kReadonly,  /**< `R` */
    kNonatomic, /**< `N` */
    kDynamic,   /**< `D` */
    kCopy,      /**< `C` */
    kRetain,    /**< `&` */
    kWeak,      /**< `W` */
    kGetter,    /**< `G<name>` */
    kSetter,    /**< `S<name>` */
    kIvar,      /**< `V<name>` */
    kOther,     /**< Anything else, kept verbatim. */
  };

  Kind kind;
  /** The name for getter, setter and ivar, the encoding for kType, the raw
   * text for kOther. */
  std::string value;
  std::optional<TypeNode> type; /**< The decoded type of a kType item. */

  /**
   * @brief Serializes the attribute back to its text.
   * @return The attribute text.
   */
  std::string Encode() const;

  bool operator==(const PropertyAttribute &other) const {
    return kind == other.kind && value == other.value && type == other.type;
  }
};

/**
 * @brief Joins attributes into a runtime property attribute string.
 * @param attributes The attributes.
 * @return The comma separated attribute string.
 */
std::string EncodePropertyAttributes(
    const std::vector<PropertyAttribute> &attributes);

/**
 * @brief Finds the first attribute of a kind.
 * @param attributes The attributes.
 * @param kind The kind to look for.
 * @return The attribute, or nullptr if none matches.
 */
const PropertyAttribute *
FindPropertyAttribute(const std::vector<PropertyAttribute> &attributes,
                      PropertyAttribute::Kind kind);

/**
 * @brief Checks whether any attribute has a kind.
 * @param attributes The attributes.
 * @param kind The kind to look for.
 * @return True if present.
 */
bool HasPropertyAttribute(const std::vector<PropertyAttribute> &attributes,
                          PropertyAttribute::Kind kind);

} // namespace models
