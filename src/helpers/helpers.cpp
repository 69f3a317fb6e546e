#include "helpers.hpp"

namespace helpers {

bool IsDigit(int curr) { return curr >= '0' && curr <= '9'; }

bool IsWhitespace(int curr) {
  return curr == ' ' || curr == '\t' || curr == '\f' || curr == '\n' ||
         curr == '\r';
}

std::string TrimWhite(const std::string &p) {
  std::string::size_type begin = 0;
  std::string::size_type end = p.length();
  while (begin < end && IsWhitespace(p[begin])) {
    begin++;
  }
  while (end > begin && IsWhitespace(p[end - 1])) {
    end--;
  }
  return p.substr(begin, end - begin);
}

std::vector<std::string> Split(std::string_view value, char separator) {
  std::vector<std::string> result;
  std::string current;
  for (char curr : value) {
    if (curr == separator) {
      if (!current.empty()) {
        result.push_back(current);
      }
      current.clear();
      continue;
    }
    current.push_back(curr);
  }
  if (!current.empty()) {
    result.push_back(current);
  }
  return result;
}

std::vector<std::string> SplitTopLevel(std::string_view value,
                                       char separator) {
  std::vector<std::string> result;
  std::string current;
  int depth = 0;
  bool in_quote = false;

  for (char curr : value) {
    if (curr == '"') {
      in_quote = !in_quote;
    } else if (!in_quote) {
      switch (curr) {
      case '{':
      case '(':
      case '[':
      case '<':
        depth++;
        break;
      case '}':
      case ')':
      case ']':
      case '>':
        if (depth > 0) {
          depth--;
        }
        break;
      default:
        if (curr == separator && depth == 0) {
          result.push_back(current);
          current.clear();
          continue;
        }
        break;
      }
    }
    current.push_back(curr);
  }
  result.push_back(current);
  return result;
}

std::string EscapeQuoted(std::string_view value) {
  std::string result;
  for (char curr : value) {
    if (curr == '\\' || curr == '"') {
      result.push_back('\\');
    }
    result.push_back(curr);
  }
  return result;
}

std::string JoinLines(const std::string &value, const std::string &separator) {
  std::string result;
  for (const auto &line : Split(value, '\n')) {
    if (!result.empty()) {
      result += separator;
    }
    result += line;
  }
  return result;
}

std::string IndentLines(const std::string &value, const std::string &prefix) {
  std::string result;
  std::string::size_type start = 0;
  while (true) {
    auto end = value.find('\n', start);
    result += prefix;
    if (end == std::string::npos) {
      result += value.substr(start);
      break;
    }
    result += value.substr(start, end - start + 1);
    start = end + 1;
  }
  return result;
}

} // namespace helpers
