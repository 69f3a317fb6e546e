#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>

namespace parser {

/**
 * @class Cursor
 * @brief Forward-only read position over a type encoding.
 *
 * The cursor never copies the text it walks: every scanned piece is returned
 * as a view into the original string, which must outlive the cursor.
 */
class Cursor {
public:
  /**
   * @brief Constructs a cursor at the start of the text.
   * @param text The text to walk.
   */
  explicit Cursor(std::string_view text);

  /**
   * @brief Checks if every character has been consumed.
   * @return True at the end of the text.
   */
  bool AtEnd() const { return pos_ >= text_.size(); }

  /**
   * @brief Gets the current character without consuming it.
   * @return The character, or '\0' at the end of the text.
   */
  char Peek() const { return AtEnd() ? '\0' : text_[pos_]; }

  /**
   * @brief Checks if the unread text begins with a prefix.
   * @param prefix The prefix to compare.
   * @return True if the prefix matches.
   */
  bool StartsWith(std::string_view prefix) const;

  /**
   * @brief Consumes characters, stopping at the end of the text.
   * @param count The number of characters to consume.
   */
  void Advance(std::size_t count = 1);

  std::size_t Position() const { return pos_; }

  /**
   * @brief Gets the unread text.
   * @return A view of the remainder.
   */
  std::string_view Rest() const { return text_.substr(pos_); }

  /**
   * @brief Gets the text consumed since a previous position.
   * @param from A position returned earlier by Position().
   * @return A view of the consumed text.
   */
  std::string_view Since(std::size_t from) const {
    return text_.substr(from, pos_ - from);
  }

  /**
   * @brief Consumes a maximal run of decimal digits.
   * @return The digits, or std::nullopt if the current character is not a
   * digit.
   */
  std::optional<std::string_view> ReadDigits();

  /**
   * @brief Consumes a maximal run of decimal digits as a number.
   * @return The number, or std::nullopt if there are no digits or the value
   * does not fit an int.
   */
  std::optional<int> ReadInt();

  /**
   * @brief Consumes a balanced bracket run.
   *
   * The current character must be @p open. Only @p open and @p close are
   * counted; other delimiters inside are left to the caller that decodes
   * the content.
   *
   * @param open The opening delimiter.
   * @param close The closing delimiter.
   * @return The text between the delimiters, or std::nullopt if the current
   * character is not @p open or the run is not closed.
   */
  std::optional<std::string_view> ReadBracket(char open, char close);

  /**
   * @brief Consumes a double-quoted name.
   *
   * A backslash escapes the following character; escapes are removed from
   * the result.
   *
   * @return The name, or std::nullopt if the current character is not a
   * quote or the name is not terminated.
   */
  std::optional<std::string> ReadQuoted();

  /**
   * @brief Consumes exactly one top-level type without decoding it.
   *
   * Used where only type boundaries matter. Qualifiers and pointers recurse
   * once into the following type, blocks, quoted objects and bit-fields are
   * consumed with their suffixes, and structs, unions and arrays are skipped
   * as balanced runs. Unterminated runs are consumed to the end of the text.
   *
   * @return The consumed text, empty only at the end of the text.
   */
  std::string_view SkipOneType();

private:
  void SkipType();
  void SkipDigits();
  bool SkipBracket(char open, char close);

  std::string_view text_;
  std::size_t pos_;
};

} // namespace parser
