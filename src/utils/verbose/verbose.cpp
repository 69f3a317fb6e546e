#include "verbose.hpp"

namespace utils::verbose {

Flags::Flags() {}

bool Flags::NeedToPrintVerbose() const { return need_to_print_verbose_; }

bool Flags::NeedToPrintVeryVerbose() const {
  return need_to_print_very_verbose_;
}

void Flags::Reset() {
  need_to_print_verbose_ = false;
  need_to_print_very_verbose_ = false;
}

void Flags::SetNeedToPrintVerbose() { need_to_print_verbose_ = true; }

void Flags::SetNeedToPrintVeryVerbose() {
  need_to_print_verbose_ = true;
  need_to_print_very_verbose_ = true;
}

} // namespace utils::verbose
