#pragma once

#include <string>

namespace input {
/**
 * @class InputPosition
 * @brief Tracks which input is being processed, for error messages.
 */
class InputPosition {
public:
  /**
   * @brief Increments the line number by 1.
   */
  static void Inc();

  /**
   * @brief Sets the line number to a new value.
   * @param new_line_number The new line number.
   */
  static void Set(int new_line_number);

  /**
   * @brief Retrieves the current line number.
   * @return The current line number, 0 when inputs are not line based.
   */
  static int Get();

  /**
   * @brief Sets the name of the current input source.
   * @param source A file name, "<stdin>" or "<args>".
   */
  static void SetSource(const std::string &source);

  /**
   * @brief Retrieves the name of the current input source.
   * @return The source name.
   */
  static std::string GetSource();

  /**
   * @brief Resets the source to "<args>" and the line number to 0.
   */
  static void Reset();

private:
  static int line_number_; /**< The current line number. */
  static std::string source_; /**< The current input source. */
};
} // namespace input
