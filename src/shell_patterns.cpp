#include <shccn/shell_patterns.h>

#include <cstddef>

namespace shccn {
namespace {

// `\s` as the patterns were written: no vertical tab.
constexpr const char kSpace[] = " \t\n\f\r";

bool IsQuote(char character) { return character == '\'' || character == '"'; }

bool IsLineTerminator(char character) {
  return character == '\n' || character == '\r';
}

ShellPatterns BuildPatterns() {
  ShellPatterns patterns;
  patterns.branch_keyword = std::regex("if|while|for|;;");
  patterns.logical_operator = std::regex("&&|\\|\\|");
  return patterns;
}

} // namespace

const ShellPatterns &Patterns() {
  static const ShellPatterns patterns = BuildPatterns();
  return patterns;
}

bool StartsWithHash(const std::string &line) {
  const auto first = line.find_first_not_of(kSpace);
  return first != std::string::npos && line[first] == '#';
}

bool HasEmptyParameterList(const std::string &line) {
  for (auto open = line.find('('); open != std::string::npos;
       open = line.find('(', open + 1)) {
    auto next = line.find_first_not_of(kSpace, open + 1);
    if (next == std::string::npos || line[next] != ')') {
      continue;
    }
    next = line.find_first_not_of(kSpace, next + 1);
    if (next != std::string::npos && line[next] == '{') {
      return true;
    }
  }
  return false;
}

bool QuoteFollowedBy(const std::string &line,
                     std::initializer_list<std::string_view> needles) {
  bool quoted = false;
  for (std::size_t i = 0; i < line.size(); ++i) {
    const auto character = line[i];
    if (IsLineTerminator(character)) {
      quoted = false;
      continue;
    }
    if (quoted) {
      for (const auto needle : needles) {
        if (line.compare(i, needle.size(), needle.data(), needle.size()) ==
            0) {
          return true;
        }
      }
    }
    if (IsQuote(character)) {
      quoted = true;
    }
  }
  return false;
}

} // namespace shccn
