#include "main_processor.hpp"

#include "../fatal/fatal.hpp"
#include "../format/declaration_viewer.hpp"
#include "../format/header_viewer.hpp"
#include "../helpers/helpers.hpp"
#include "../input/input_position.hpp"
#include "../parser/method_parser.hpp"
#include "../parser/property_attributes.hpp"
#include "../parser/type_decoder.hpp"
#include "../utils/verbose/verbose.hpp"
#include "arguments_parser.hpp"
#include <fmt/core.h>
#include <fstream>

namespace {
constexpr std::string_view kVersion = "objcenc 1.0.0";

std::string ViewOffset(const std::optional<int> &offset) {
  return offset ? std::to_string(*offset) : std::string("-");
}
} // namespace

MainProcessor::MainProcessor(std::istream &in, std::ostream &out)
    : in_(in), out_(out) {}

int MainProcessor::main(int argc, char *argv[]) {
  loger::ResetErrorCount();
  input::InputPosition::Reset();
  utils::verbose::Flags::getInstance().Reset();

  ArgumentsParser parser;
  settings_ = parser.Parse(argc, argv);
  if (HandleLaunchSettings()) {
    return 0;
  }

  if (settings_.input_file) {
    std::ifstream file(*settings_.input_file);
    if (!file.is_open()) {
      loger::fatal("cannot open input file", *settings_.input_file);
    }
    ProcessStream(file, *settings_.input_file);
  }

  if (!settings_.inputs.empty()) {
    input::InputPosition::Reset();
    for (const auto &argument : settings_.inputs) {
      input::InputPosition::Inc();
      Process(helpers::TrimWhite(argument));
    }
  } else if (!settings_.input_file) {
    ProcessStream(in_, "<stdin>");
  }

  loger::verbose(fmt::format("{} error(s)", loger::ErrorCount()));
  return loger::ErrorCount() > 0 ? 1 : 0;
}

bool MainProcessor::HandleLaunchSettings() {
  if (settings_.need_to_print_help_and_stop) {
    PrintHelp();
    return true;
  }
  if (settings_.need_to_print_version_and_stop) {
    PrintVersion();
    return true;
  }
  if (settings_.need_class_member && settings_.mode != Mode::kProperty &&
      !settings_.selector) {
    loger::verbose("-c has no effect without -s or -p");
  }
  return false;
}

void MainProcessor::PrintHelp() {
  out_ << "use: objcenc [-option] ... [encoding] ...\n"
          "\t-d decode each encoding to a C declaration (default)\n"
          "\t-e decode and print the normalized encoding\n"
          "\t-m split each encoding as a method signature\n"
          "\t-sNAME with -m, print a method header for selector NAME\n"
          "\t-c with -s or -p, declare a class member\n"
          "\t-pNAME print a property NAME from an attribute string\n"
          "\t-iNAME print an instance variable NAME\n"
          "\t-fFILE read encodings from FILE, one per line\n"
          "\t-tN indent struct members by N spaces (default 4)\n"
          "\t-v verbose, -vv more verbose\n"
          "\t-V print version number and exit\n"
          "\t-h print this message\n"
          "without encodings or -f, encodings are read from stdin\n";
}

void MainProcessor::PrintVersion() { out_ << kVersion << "\n"; }

void MainProcessor::ProcessStream(std::istream &stream,
                                  const std::string &source) {
  input::InputPosition::SetSource(source);
  input::InputPosition::Set(0);
  std::string line;
  while (std::getline(stream, line)) {
    input::InputPosition::Inc();
    auto input = helpers::TrimWhite(line);
    if (input.empty()) {
      continue;
    }
    Process(input);
  }
}

bool MainProcessor::Process(const std::string &input) {
  loger::verbose(fmt::format("processing '{}'", input));
  switch (settings_.mode) {
  case Mode::kDecode:
    return ProcessDecode(input);
  case Mode::kEncode:
    return ProcessEncode(input);
  case Mode::kMethod:
    return ProcessMethod(input);
  case Mode::kProperty:
    return ProcessProperty(input);
  case Mode::kIvar:
    return ProcessIvar(input);
  }
  return false;
}

bool MainProcessor::ProcessDecode(const std::string &input) {
  auto type = parser::Decode(input);
  if (!type) {
    loger::non_fatal("cannot decode type encoding", input);
    return false;
  }
  loger::very_verbose(fmt::format("normalized encoding '{}'", type->Encode()));
  format::DeclarationViewer viewer(settings_.BuildTab());
  out_ << viewer.View(*type) << "\n";
  return true;
}

bool MainProcessor::ProcessEncode(const std::string &input) {
  auto type = parser::Decode(input);
  if (!type) {
    loger::non_fatal("cannot decode type encoding", input);
    return false;
  }
  out_ << type->Encode() << "\n";
  return true;
}

bool MainProcessor::ProcessMethod(const std::string &input) {
  auto signature = parser::ParseMethodSignature(input);
  if (!signature.return_value.Decode()) {
    loger::non_fatal("cannot decode method return type", input);
    return false;
  }
  for (const auto &argument : signature.arguments) {
    if (!argument.Decode()) {
      loger::non_fatal("cannot decode method argument type",
                       argument.type_encoding);
      return false;
    }
  }
  loger::very_verbose(fmt::format("{} argument(s), normalized '{}'",
                                  signature.arguments.size(),
                                  signature.Encode()));

  format::HeaderViewer headers;
  if (settings_.selector) {
    out_ << headers.ViewMethod(*settings_.selector, signature,
                               settings_.need_class_member)
         << "\n";
    return true;
  }

  format::DeclarationViewer viewer(settings_.BuildTab());
  out_ << fmt::format("return\t{}\t{}\t{}\n",
                      signature.return_value.type_encoding,
                      ViewOffset(signature.return_value.offset),
                      viewer.ViewForArgument(signature.return_value.Type()));
  if (signature.stack_size) {
    out_ << fmt::format("stack\t{}\n", *signature.stack_size);
  }
  for (std::size_t i = 0; i < signature.arguments.size(); i++) {
    const auto &argument = signature.arguments[i];
    out_ << fmt::format("arg{}\t{}\t{}\t{}\n", i, argument.type_encoding,
                        ViewOffset(argument.offset),
                        viewer.ViewForArgument(argument.Type()));
  }
  return true;
}

bool MainProcessor::ProcessProperty(const std::string &input) {
  using Kind = models::PropertyAttribute::Kind;
  auto attributes = parser::ParsePropertyAttributes(input);
  const auto *type = models::FindPropertyAttribute(attributes, Kind::kType);
  if (type == nullptr) {
    loger::non_fatal("property attributes have no type", input);
    return false;
  }
  if (!type->type) {
    loger::non_fatal("cannot decode property type", type->value);
    return false;
  }
  for (const auto &attribute : attributes) {
    if (attribute.kind == Kind::kOther) {
      loger::very_verbose(
          fmt::format("unknown property attribute '{}'", attribute.value));
    }
  }
  format::HeaderViewer headers;
  out_ << headers.ViewProperty(settings_.member_name.value_or(""), attributes,
                               settings_.need_class_member)
       << "\n";
  return true;
}

bool MainProcessor::ProcessIvar(const std::string &input) {
  if (!parser::Decode(input)) {
    loger::non_fatal("cannot decode ivar type", input);
    return false;
  }
  format::HeaderViewer headers;
  out_ << headers.ViewIvar(settings_.member_name.value_or(""), input) << "\n";
  return true;
}
