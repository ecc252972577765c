#pragma once

#include <cstddef>
#include <string>
#include <utility>
#include <vector>

namespace shccn {

inline constexpr const char kBareCode[] = "BARE_CODE";

class SourceFile {
public:
  SourceFile(std::string name, std::vector<std::string> lines)
      : name_(std::move(name)), lines_(std::move(lines)) {}

  const std::string &Name() const { return name_; }
  const std::vector<std::string> &Lines() const { return lines_; }

private:
  std::string name_;
  std::vector<std::string> lines_;
};

struct Function {
  std::string name;
  std::vector<std::string> body;
};

struct FileMetrics {
  std::string name;
  std::size_t line_count = 0;
  std::size_t code_count = 0;
  std::size_t comment_count = 0;
  std::size_t blank_count = 0;
  std::size_t function_count = 0;
};

struct FunctionMetrics {
  std::string name;
  std::size_t code_line_count = 0;
  int ccn = 1;
};

struct ScriptMetrics {
  FileMetrics file;
  std::vector<FunctionMetrics> functions;
};

struct AnalysisConfig {
  std::vector<std::string> inputs;
  std::vector<std::string> extensions = {".sh", ".bash"};
  std::vector<std::string> ignored_paths;
  std::vector<std::string> formats;
};

struct ReadFailure {
  std::string path;
  std::string reason;
};

// Directories that could not be walked land in `failures`; everything found
// elsewhere is still listed in `files`.
struct SourceAcquisitionResult {
  std::vector<std::string> files;
  std::vector<ReadFailure> failures;
};

struct AnalysisResult {
  std::vector<ScriptMetrics> scripts;
  std::vector<ReadFailure> failures;
};

struct Report {
  std::string table;
  std::string json;
};

struct PipelineResult {
  Report report;
  AnalysisResult analysis;
};

} // namespace shccn
