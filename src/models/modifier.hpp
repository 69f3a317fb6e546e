#pragma once

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace models {

/**
 * @enum Modifier
 * @brief Single-character qualifiers that prefix a type encoding.
 *
 * The underlying value of each enumerator is the character used in the
 * encoding.
 */
enum class Modifier : char {
  kComplex = 'j',  /**< _Complex number. */
  kAtomic = 'A',   /**< _Atomic access. */
  kConst = 'r',    /**< Constant value. */
  kIn = 'n',       /**< Input parameter. */
  kInout = 'N',    /**< Input-output parameter. */
  kOut = 'o',      /**< Output parameter. */
  kBycopy = 'O',   /**< Passed by copy. */
  kByref = 'R',    /**< Passed by reference. */
  kOneway = 'V',   /**< Asynchronous, no reply. */
  kRegister = '+', /**< Register storage hint. */
};

/**
 * @brief All modifiers, in declaration order.
 */
inline constexpr std::array<Modifier, 10> kAllModifiers{
    Modifier::kComplex, Modifier::kAtomic, Modifier::kConst,
    Modifier::kIn,      Modifier::kInout,  Modifier::kOut,
    Modifier::kBycopy,  Modifier::kByref,  Modifier::kOneway,
    Modifier::kRegister,
};

/**
 * @brief Looks up the modifier encoded by a character.
 * @param value The encoding character.
 * @return The modifier, or std::nullopt if the character is not a qualifier.
 */
std::optional<Modifier> ParseModifier(char value);

/**
 * @brief Returns the encoding of a modifier.
 * @param modifier The modifier.
 * @return A one-character string.
 */
std::string EncodeModifier(Modifier modifier);

/**
 * @brief Returns the declaration keyword of a modifier.
 * @param modifier The modifier.
 * @return The keyword, e.g. "const" or "_Atomic".
 */
std::string_view ModifierKeyword(Modifier modifier);

} // namespace models
