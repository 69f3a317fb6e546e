#include "cursor.hpp"

#include "../helpers/helpers.hpp"
#include "../models/modifier.hpp"
#include <charconv>

namespace parser {

Cursor::Cursor(std::string_view text) : text_(text), pos_(0) {}

bool Cursor::StartsWith(std::string_view prefix) const {
  return Rest().substr(0, prefix.size()) == prefix;
}

void Cursor::Advance(std::size_t count) {
  pos_ = pos_ + count > text_.size() ? text_.size() : pos_ + count;
}

std::optional<std::string_view> Cursor::ReadDigits() {
  auto start = pos_;
  SkipDigits();
  if (start == pos_) {
    return std::nullopt;
  }
  return Since(start);
}

std::optional<int> Cursor::ReadInt() {
  auto digits = ReadDigits();
  if (!digits) {
    return std::nullopt;
  }
  int value = 0;
  auto [ptr, ec] =
      std::from_chars(digits->data(), digits->data() + digits->size(), value);
  if (ec != std::errc() || ptr != digits->data() + digits->size()) {
    return std::nullopt;
  }
  return value;
}

std::optional<std::string_view> Cursor::ReadBracket(char open, char close) {
  if (Peek() != open) {
    return std::nullopt;
  }
  auto start = pos_ + 1;
  if (!SkipBracket(open, close)) {
    return std::nullopt;
  }
  return text_.substr(start, pos_ - 1 - start);
}

std::optional<std::string> Cursor::ReadQuoted() {
  if (Peek() != '"') {
    return std::nullopt;
  }
  std::string result;
  for (auto i = pos_ + 1; i < text_.size(); i++) {
    if (text_[i] == '\\') {
      if (++i == text_.size()) {
        break;
      }
      result.push_back(text_[i]);
      continue;
    }
    if (text_[i] == '"') {
      pos_ = i + 1;
      return result;
    }
    result.push_back(text_[i]);
  }
  return std::nullopt;
}

std::string_view Cursor::SkipOneType() {
  auto start = pos_;
  SkipType();
  return Since(start);
}

void Cursor::SkipType() {
  if (AtEnd()) {
    return;
  }
  char curr = Peek();
  Advance();

  if (models::ParseModifier(curr)) {
    SkipType();
    return;
  }

  switch (curr) {
  case '^':
    SkipType();
    break;
  case '@':
    if (Peek() == '?') {
      Advance();
      if (Peek() == '<') {
        SkipBracket('<', '>');
      }
    } else if (Peek() == '"') {
      if (!ReadQuoted()) {
        pos_ = text_.size();
      }
    }
    break;
  case 'b':
    SkipDigits();
    break;
  case '!':
    SkipDigits();
    SkipType();
    break;
  case '{':
    pos_--;
    SkipBracket('{', '}');
    break;
  case '(':
    pos_--;
    SkipBracket('(', ')');
    break;
  case '[':
    pos_--;
    SkipBracket('[', ']');
    break;
  default:
    break;
  }
}

void Cursor::SkipDigits() {
  while (!AtEnd() && helpers::IsDigit(Peek())) {
    pos_++;
  }
}

bool Cursor::SkipBracket(char open, char close) {
  int depth = 0;
  while (!AtEnd()) {
    char curr = text_[pos_++];
    if (curr == open) {
      depth++;
    } else if (curr == close) {
      depth--;
      if (depth == 0) {
        return true;
      }
    }
  }
  return false;
}

} // namespace parser
