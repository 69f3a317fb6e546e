#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * @brief What the program does with each input.
 */
enum class Mode {
  kDecode,   /**< Print a C-like declaration. */
  kEncode,   /**< Print the normalized encoding. */
  kMethod,   /**< Split a method signature or print a method header. */
  kProperty, /**< Print a property declaration. */
  kIvar      /**< Print an instance variable declaration. */
};

struct LaunchSettings {
  Mode mode = Mode::kDecode;
  bool need_class_member = false;
  bool need_to_print_version_and_stop = false;
  bool need_to_print_help_and_stop = false;
  int indent_width = 4;

  std::optional<std::string> selector;
  std::optional<std::string> member_name;
  std::optional<std::string> input_file;

  std::vector<std::string> inputs;

  /**
   * @brief Sets the indent width from the text of a `-t` option.
   * @param value The digits following `-t`.
   * @throws std::runtime_error If the value is missing or out of range.
   */
  void SetIndentWidth(const std::string &value);

  /**
   * @brief Builds the indentation unit used by the declaration viewer.
   * @return `indent_width` spaces.
   */
  std::string BuildTab() const;
};
