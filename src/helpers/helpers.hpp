#pragma once
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Namespace containing helper functions for character and string
 * manipulation.
 *
 * The `helpers` namespace provides small text utilities shared by the
 * parsers, the viewers and the command line front end.
 */
namespace helpers {

/**
 * @brief Checks if the given character is a decimal digit.
 * @param curr The character to check.
 * @return `true` if the character is a digit, `false` otherwise.
 */
bool IsDigit(int curr);

/**
 * @brief Checks if the given character is a whitespace character.
 * @param curr The character to check.
 * @return `true` if the character is a whitespace character, `false`
 * otherwise.
 */
bool IsWhitespace(int curr);

/**
 * @brief Removes leading and trailing white space.
 * @param p The input string.
 * @return The trimmed string.
 */
std::string TrimWhite(const std::string &p);

/**
 * @brief Splits a string at every occurrence of a separator.
 * @param value The input string.
 * @param separator The separator character.
 * @return The non-empty pieces, in order.
 */
std::vector<std::string> Split(std::string_view value, char separator);

/**
 * @brief Splits a string at separators that are outside quotes and brackets.
 *
 * `"` toggles quoting; `{`, `(`, `[` and `<` open a nesting level that the
 * matching closer ends. Empty pieces are kept.
 *
 * @param value The input string.
 * @param separator The separator character.
 * @return The pieces, in order.
 */
std::vector<std::string> SplitTopLevel(std::string_view value, char separator);

/**
 * @brief Joins the lines of a multi-line string with a single separator.
 * @param value The input string.
 * @param separator Placed between consecutive non-empty lines.
 * @return The joined string.
 */
/**
 * @brief Escapes backslashes and double quotes for a quoted name.
 */
std::string EscapeQuoted(std::string_view value);

std::string JoinLines(const std::string &value, const std::string &separator);

/**
 * @brief Prefixes every line of a multi-line string.
 * @param value The input string.
 * @param prefix The prefix for each line.
 * @return The prefixed string.
 */
std::string IndentLines(const std::string &value, const std::string &prefix);

} // namespace helpers
