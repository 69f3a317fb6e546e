#include "arguments_parser.hpp"

#include "../utils/verbose/verbose.hpp"
#include <iostream>
#include <stdexcept>
#include <string>

LaunchSettings ArgumentsParser::Parse(int argc, char **argv) {
  LaunchSettings result;
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  while (argc > 1 && argv[1][0] == '-') {
    std::string option(argv[1]);
    if (option == "-" || option == "--") {
      argc--;
      argv++;
      break;
    }
    switch (argv[1][1]) {
    case 'c': {
      result.need_class_member = true;
      break;
    }
    case 'd': {
      result.mode = Mode::kDecode;
      break;
    }
    case 'e': {
      result.mode = Mode::kEncode;
      break;
    }
    case 'f': {
      if (argv[1][2] == '\0') {
        result.need_to_print_help_and_stop = true;
        break;
      }
      result.input_file = std::string(&argv[1][2]);
      break;
    }
    case 'h': {
      result.need_to_print_help_and_stop = true;
      break;
    }
    case 'i': {
      if (argv[1][2] == '\0') {
        result.need_to_print_help_and_stop = true;
        break;
      }
      result.mode = Mode::kIvar;
      result.member_name = std::string(&argv[1][2]);
      break;
    }
    case 'm': {
      result.mode = Mode::kMethod;
      break;
    }
    case 'p': {
      if (argv[1][2] == '\0') {
        result.need_to_print_help_and_stop = true;
        break;
      }
      result.mode = Mode::kProperty;
      result.member_name = std::string(&argv[1][2]);
      break;
    }
    case 's': {
      if (argv[1][2] == '\0') {
        result.need_to_print_help_and_stop = true;
        break;
      }
      result.mode = Mode::kMethod;
      result.selector = std::string(&argv[1][2]);
      break;
    }
    case 't': {
      try {
        result.SetIndentWidth(std::string(&argv[1][2]));
      } catch (const std::runtime_error &error) {
        std::cerr << error.what() << std::endl;
        result.need_to_print_help_and_stop = true;
      }
      break;
    }
    case 'v': {
      verbose_flags.SetNeedToPrintVerbose();
      if (argv[1][2] == 'v') {
        verbose_flags.SetNeedToPrintVeryVerbose();
      }
      break;
    }
    case 'V': {
      result.need_to_print_version_and_stop = true;
      break;
    }
    default: {
      result.need_to_print_help_and_stop = true;
      break;
    }
    }
    argc--;
    argv++;
  }
  for (int i = 1; i < argc; i++) {
    result.inputs.emplace_back(argv[i]);
  }
  return result;
}
