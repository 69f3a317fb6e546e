#include "input_position.hpp"

namespace input {

void InputPosition::Inc() { line_number_++; }

void InputPosition::Set(int new_line_number) { line_number_ = new_line_number; }

int InputPosition::Get() { return line_number_; }

void InputPosition::SetSource(const std::string &source) { source_ = source; }

std::string InputPosition::GetSource() { return source_; }

void InputPosition::Reset() {
  source_ = "<args>";
  line_number_ = 0;
}

int InputPosition::line_number_ = 0;
std::string InputPosition::source_ = "<args>";
} // namespace input
