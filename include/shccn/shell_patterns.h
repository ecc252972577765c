#pragma once

#include <initializer_list>
#include <regex>
#include <string>
#include <string_view>

namespace shccn {

// Regular expressions shared by every analysis. Built once, never modified.
// Only patterns without unbounded repetition belong here: libstdc++ matches
// `*` recursively and a long enough line exhausts the stack.
struct ShellPatterns {
  std::regex branch_keyword;
  std::regex logical_operator;
};

const ShellPatterns &Patterns();

// Same result as searching for `^\s*#`.
bool StartsWithHash(const std::string &line);

// Same result as searching for `\(\s*\)\s*\{`.
bool HasEmptyParameterList(const std::string &line);

// Same result as searching for `['"].*(n1|n2|...)`: a quote followed later on
// the line by one of `needles`, with no '\n' or '\r' in between.
bool QuoteFollowedBy(const std::string &line,
                     std::initializer_list<std::string_view> needles);

} // namespace shccn
