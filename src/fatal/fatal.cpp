#include "fatal.hpp"

#include "../input/input_position.hpp"
#include "../utils/verbose/verbose.hpp"
#include <cstdlib>
#include <fmt/core.h>
#include <iostream>

namespace loger {
static constexpr std::string_view kProgram = "objcenc";

static int nr_errs = 0;

static std::string Location() {
  if (input::InputPosition::Get() == 0) {
    return fmt::format("{}", input::InputPosition::GetSource());
  }
  return fmt::format("{}:{}", input::InputPosition::GetSource(),
                     input::InputPosition::Get());
}

void non_fatal(const std::string_view &s1,
               const std::optional<std::string> &s2) {
  std::cerr << fmt::format("{0}: {1}, Error: {2}{3}", kProgram, Location(), s1,
                           s2 ? fmt::format(" '{}'", *s2) : "");
  std::cerr << std::endl;
  nr_errs++;
}

void fatal(const std::string_view &s1, const std::optional<std::string> &s2) {
  non_fatal(s1, s2);
  std::exit(1);
}

void verbose(const std::string_view &message) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (!verbose_flags.NeedToPrintVerbose()) {
    return;
  }
  std::cerr << fmt::format("{0}: {1}: {2}", kProgram, Location(), message)
            << std::endl;
}

void very_verbose(const std::string_view &message) {
  auto &verbose_flags = utils::verbose::Flags::getInstance();
  if (!verbose_flags.NeedToPrintVeryVerbose()) {
    return;
  }
  std::cerr << fmt::format("{0}: {1}:   {2}", kProgram, Location(), message)
            << std::endl;
}

int ErrorCount() { return nr_errs; }

void ResetErrorCount() { nr_errs = 0; }

} // namespace loger
