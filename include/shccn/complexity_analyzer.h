#pragma once

#include <string>
#include <vector>

namespace shccn {

// Heuristic cyclomatic complexity of a function body. Starts at 1, adds one for
// a line holding a branch keyword (`if`, `while`, `for` or `;;`) unless the
// keyword follows a quote on that line, and one for every space-separated
// token holding `&&` or `||`.
int ComputeCcn(const std::vector<std::string> &body);

int BranchIncrement(const std::string &line);
int LogicalOperatorIncrement(const std::string &line);

} // namespace shccn
