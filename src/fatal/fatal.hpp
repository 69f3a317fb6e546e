#ifndef FATAL_OBJCENC_H
#define FATAL_OBJCENC_H

#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Namespace containing logging functions for error handling and
 * tracing.
 *
 * The `loger` namespace reports fatal and non-fatal errors of the command
 * line front end, counts them, and prints verbose traces when the verbosity
 * flags ask for them. Messages are prefixed with the current input position.
 */
namespace loger {

/**
 * @brief Logs a fatal error with an optional additional message and exits
 * with status 1.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
[[noreturn]] void fatal(const std::string_view &s1,
                        const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a non-fatal error with an optional additional message.
 * @param s1 The main error message.
 * @param s2 Optional additional message.
 */
void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2 = std::nullopt);

/**
 * @brief Logs a trace message if verbose output is enabled.
 * @param message The message.
 */
void verbose(const std::string_view &message);

/**
 * @brief Logs a trace message if very verbose output is enabled.
 * @param message The message.
 */
void very_verbose(const std::string_view &message);

/**
 * @brief Returns the number of errors logged since the last reset.
 * @return The error count.
 */
int ErrorCount();

/**
 * @brief Resets the error count to zero.
 */
void ResetErrorCount();

} // namespace loger

#endif
