#include "modifier.hpp"

namespace models {

std::optional<Modifier> ParseModifier(char value) {
  for (auto modifier : kAllModifiers) {
    if (static_cast<char>(modifier) == value) {
      return modifier;
    }
  }
  return std::nullopt;
}

std::string EncodeModifier(Modifier modifier) {
  return std::string(1, static_cast<char>(modifier));
}

std::string_view ModifierKeyword(Modifier modifier) {
  switch (modifier) {
  case Modifier::kComplex:
    return "_Complex";
  case Modifier::kAtomic:
    return "_Atomic";
  case Modifier::kConst:
    return "const";
  case Modifier::kIn:
    return "in";
  case Modifier::kInout:
    return "inout";
  case Modifier::kOut:
    return "out";
  case Modifier::kBycopy:
    return "bycopy";
  case Modifier::kByref:
    return "byref";
  case Modifier::kOneway:
    return "oneway";
  case Modifier::kRegister:
    return "register";
  }
  return "";
}

} // namespace models
