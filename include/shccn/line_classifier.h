#pragma once

#include <cstddef>
#include <string>

namespace shccn {

// True when nothing but ' ' characters remain. Tabs count as content.
bool IsBlank(const std::string &line);

// Comment pattern alone, without the first-line exception.
bool MatchesCommentPattern(const std::string &line);

// The first physical line (index 0) is never a comment: a shebang is code.
bool IsComment(const std::string &line, std::size_t line_index);

// Drops every '...' segment, quotes included. An unterminated quote drops
// the remainder of the line.
std::string StripSingleQuoted(const std::string &line);

bool IsFunctionStart(const std::string &line);

} // namespace shccn
