#include "launch_settings.hpp"

#include "../helpers/helpers.hpp"

namespace {
constexpr int kMaxIndentWidth = 16;
}

void LaunchSettings::SetIndentWidth(const std::string &value) {
  if (value.empty() || value.size() > 2) {
    throw std::runtime_error("objcenc: bad or missing parameter on -t");
  }
  for (char c : value) {
    if (!helpers::IsDigit(c)) {
      throw std::runtime_error("objcenc: bad or missing parameter on -t");
    }
  }
  auto width = std::stoi(value);
  if (width > kMaxIndentWidth) {
    throw std::runtime_error("objcenc: bad or missing parameter on -t");
  }
  indent_width = width;
}

std::string LaunchSettings::BuildTab() const {
  return std::string(static_cast<std::size_t>(indent_width), ' ');
}
