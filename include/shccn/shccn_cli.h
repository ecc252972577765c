#pragma once

#include <shccn/logging.h>
#include <shccn/models.h>

#include <filesystem>
#include <iosfwd>
#include <optional>
#include <string>
#include <vector>

namespace shccn {

// Options of `shccn analyze`, from the command line or a YAML config file.
// Unset values fall back to the defaults in BuildAnalysisConfig.
struct AnalyzeOptions {
  std::vector<std::string> inputs;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> formats;
  std::vector<std::string> extensions;
  std::vector<std::string> ignored_paths;
  std::optional<LogLevel> log_level;
  std::optional<std::string> analyzer;
  std::optional<std::string> reporter;
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);

// Values given on the command line replace those from the config file.
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options);

void PrintAnalyzeUsage(std::ostream &stream);

int RunAnalyze(const std::vector<std::string> &arguments,
               std::ostream &output, std::ostream &log);
int RunAnalyze(const std::vector<std::string> &arguments);

} // namespace shccn
