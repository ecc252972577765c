#include <shccn/complexity_analyzer.h>

#include <shccn/shell_patterns.h>

#include <cstddef>
#include <regex>

namespace shccn {

int BranchIncrement(const std::string &line) {
  const auto &patterns = Patterns();
  if (!std::regex_search(line, patterns.branch_keyword)) {
    return 0;
  }
  if (QuoteFollowedBy(line, {"if", "while", "for"})) {
    return 0;
  }
  return 1;
}

int LogicalOperatorIncrement(const std::string &line) {
  const auto &pattern = Patterns().logical_operator;
  int increment = 0;
  std::size_t start = 0;
  while (start <= line.size()) {
    auto end = line.find(' ', start);
    if (end == std::string::npos) {
      end = line.size();
    }
    if (std::regex_search(line.begin() + static_cast<std::ptrdiff_t>(start),
                          line.begin() + static_cast<std::ptrdiff_t>(end),
                          pattern)) {
      ++increment;
    }
    start = end + 1;
  }
  return increment;
}

int ComputeCcn(const std::vector<std::string> &body) {
  int ccn = 1;
  for (const auto &line : body) {
    ccn += BranchIncrement(line);
    ccn += LogicalOperatorIncrement(line);
  }
  return ccn;
}

} // namespace shccn
