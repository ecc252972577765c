#include <shccn/function_extractor.h>

#include <shccn/line_classifier.h>
#include <shccn/shell_patterns.h>

#include <string_view>

namespace shccn {
namespace {

constexpr std::string_view kFunctionKeyword = "function";

bool IsNameNoise(char character) {
  return character == '{' || character == '(' || character == ')' ||
         character == ' ';
}

bool EndsFunction(const std::string &line) {
  if (line.find('}') == std::string::npos) {
    return false;
  }
  return !QuoteFollowedBy(line, {"}"});
}

} // namespace

void FunctionTable::Declare(const std::string &name) { Entry(name); }

void FunctionTable::Append(const std::string &name, const std::string &line) {
  Entry(name).body.push_back(line);
}

Function &FunctionTable::Entry(const std::string &name) {
  const auto [position, inserted] =
      positions_.emplace(name, functions_.size());
  if (inserted) {
    functions_.push_back(Function{name, {}});
  }
  return functions_[position->second];
}

std::vector<std::string> CodeLines(const std::vector<std::string> &lines) {
  std::vector<std::string> code;
  code.reserve(lines.size());
  for (const auto &line : lines) {
    if (MatchesCommentPattern(line) || IsBlank(line)) {
      continue;
    }
    code.push_back(line);
  }
  return code;
}

std::string FunctionName(const std::string &declaration) {
  std::string name;
  name.reserve(declaration.size());
  for (std::size_t i = 0; i < declaration.size();) {
    if (declaration.compare(i, kFunctionKeyword.size(), kFunctionKeyword) ==
        0) {
      i += kFunctionKeyword.size();
      continue;
    }
    if (!IsNameNoise(declaration[i])) {
      name.push_back(declaration[i]);
    }
    ++i;
  }
  return name;
}

FunctionTable ExtractFunctions(const std::vector<std::string> &code_lines) {
  FunctionTable table;
  bool inside = false;
  std::string active;
  for (const auto &line : code_lines) {
    if (inside) {
      table.Append(active, line);
      if (EndsFunction(line)) {
        inside = false;
        active.clear();
      }
      continue;
    }

    if (IsFunctionStart(line)) {
      active = FunctionName(line);
      table.Declare(active);
      inside = true;
      continue;
    }
    table.Append(kBareCode, line);
  }
  return table;
}

} // namespace shccn
