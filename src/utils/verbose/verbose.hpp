#pragma once

namespace utils::verbose {
/**
 * @class Flags
 * @brief Controls verbosity flags for printing trace information.
 *
 * Use the provided setter methods to enable specific flags. Reset() clears
 * them before a new run.
 */
class Flags {
private:
  /**
   * @brief Default constructor.
   */
  Flags();

  Flags(const Flags &other) = delete;
  Flags &operator=(const Flags &other) = delete;

public:
  /**
   * @brief Check if the flag to trace each processed input is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVerbose() const;

  /**
   * @brief Check if the flag to trace each decoded component is active.
   * @return True if the flag is active, false otherwise.
   */
  bool NeedToPrintVeryVerbose() const;

  /**
   * @brief Clear every flag.
   */
  void Reset();

  /**
   * @brief Set the flag to trace each processed input.
   */
  void SetNeedToPrintVerbose();

  /**
   * @brief Set the flag to trace each decoded component. Implies verbose.
   */
  void SetNeedToPrintVeryVerbose();

  static Flags &getInstance() {
    static Flags instance;
    return instance;
  }

private:
  bool need_to_print_verbose_ = false;
  bool need_to_print_very_verbose_ = false;
};

} // namespace utils::verbose
