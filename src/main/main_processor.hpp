#pragma once

#include "launch_settings.hpp"

#include <istream>
#include <ostream>
#include <string>

/**
 * @brief Class representing the main processor of the program.
 *
 * Reads inputs from the command line, a file or the input stream, handles
 * each one according to the launch settings and writes results to the
 * output stream. Errors go through `loger` and decide the exit status.
 */
class MainProcessor {
public:
  /**
   * @brief Constructs a processor over the given streams.
   * @param in Stream read when no inputs are given on the command line.
   * @param out Stream receiving the results.
   */
  MainProcessor(std::istream &in, std::ostream &out);

  /**
   * @brief The main entry point of the program.
   * @param argc The number of command-line arguments.
   * @param argv An array of command-line argument strings.
   * @return The exit status of the program: 0 when every input was
   * processed, 1 otherwise.
   */
  int main(int argc, char *argv[]);

private:
  /**
   * @brief Handles the stop-early settings.
   * @return True if the program must stop.
   */
  bool HandleLaunchSettings();

  void PrintHelp();
  void PrintVersion();

  /**
   * @brief Processes every non-blank line of a stream.
   * @param stream The stream.
   * @param source The name reported in error messages.
   */
  void ProcessStream(std::istream &stream, const std::string &source);

  /**
   * @brief Processes one input according to the mode.
   * @param input The input text, already trimmed.
   * @return True on success. Failures have been reported.
   */
  bool Process(const std::string &input);

  bool ProcessDecode(const std::string &input);
  bool ProcessEncode(const std::string &input);
  bool ProcessMethod(const std::string &input);
  bool ProcessProperty(const std::string &input);
  bool ProcessIvar(const std::string &input);

  std::istream &in_;
  std::ostream &out_;
  LaunchSettings settings_;
};
