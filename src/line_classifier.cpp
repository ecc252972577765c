#include <shccn/line_classifier.h>

#include <shccn/shell_patterns.h>

#include <algorithm>

namespace shccn {

bool IsBlank(const std::string &line) {
  return std::all_of(line.begin(), line.end(),
                     [](char character) { return character == ' '; });
}

bool MatchesCommentPattern(const std::string &line) {
  return StartsWithHash(line);
}

bool IsComment(const std::string &line, std::size_t line_index) {
  if (line_index == 0) {
    return false;
  }
  return MatchesCommentPattern(line);
}

std::string StripSingleQuoted(const std::string &line) {
  std::string stripped;
  stripped.reserve(line.size());
  bool inside_quote = false;
  for (const auto character : line) {
    if (character == '\'') {
      inside_quote = !inside_quote;
      continue;
    }
    if (!inside_quote) {
      stripped.push_back(character);
    }
  }
  return stripped;
}

bool IsFunctionStart(const std::string &line) {
  std::string candidate = line;
  std::replace(candidate.begin(), candidate.end(), '"', '\'');
  if (candidate.find('\'') != std::string::npos) {
    candidate = StripSingleQuoted(candidate);
  }
  return HasEmptyParameterList(candidate);
}

} // namespace shccn
