#pragma once

#include <shccn/models.h>

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

namespace shccn {

// Function bodies keyed by name, in first-seen order. Appending to a name that
// already exists extends its body, so redeclared functions share one entry.
class FunctionTable {
public:
  void Declare(const std::string &name);
  void Append(const std::string &name, const std::string &line);

  const std::vector<Function> &Functions() const { return functions_; }
  std::size_t Size() const { return functions_.size(); }
  bool Empty() const { return functions_.empty(); }

private:
  Function &Entry(const std::string &name);

  std::vector<Function> functions_;
  std::unordered_map<std::string, std::size_t> positions_;
};

// Lines that are neither blank nor match the comment pattern. A shebang on the
// first line is dropped here as well.
std::vector<std::string> CodeLines(const std::vector<std::string> &lines);

std::string FunctionName(const std::string &declaration);

FunctionTable ExtractFunctions(const std::vector<std::string> &code_lines);

} // namespace shccn
