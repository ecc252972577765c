#include <shccn/shccn_cli.h>

#include <shccn/cli_exit_codes.h>
#include <shccn/default_analyzer_pipeline.h>

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <stdexcept>
#include <utility>

#include <yaml-cpp/yaml.h>

namespace {

using shccn::AnalyzeOptions;

constexpr const char kTableReportName[] = "shccn_report.txt";
constexpr const char kJsonReportName[] = "shccn_report.json";
constexpr std::size_t kUsageColumn = 24;

std::string Trim(const std::string &value) {
  const auto first = value.find_first_not_of(" \t");
  if (first == std::string::npos) {
    return "";
  }
  return value.substr(first, value.find_last_not_of(" \t") - first + 1);
}

// Splits "a, b,,c" into {"a", "b", "c"}.
std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::size_t start = 0;
  while (start <= raw_values.size()) {
    auto end = raw_values.find(',', start);
    if (end == std::string::npos) {
      end = raw_values.size();
    }
    auto value = Trim(raw_values.substr(start, end - start));
    if (!value.empty()) {
      values.push_back(std::move(value));
    }
    start = end + 1;
  }
  return values;
}

void AppendUnique(std::string value, std::vector<std::string> &target) {
  if (std::find(target.begin(), target.end(), value) == target.end()) {
    target.push_back(std::move(value));
  }
}

void AddInputs(const std::string &value, AnalyzeOptions &options) {
  for (const auto &input : SplitList(value)) {
    AppendUnique(input, options.inputs);
  }
}

void AddFormats(const std::string &value, AnalyzeOptions &options) {
  for (auto format : SplitList(value)) {
    std::transform(
        format.begin(), format.end(), format.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (format != "table" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    AppendUnique(std::move(format), options.formats);
  }
}

void AddExtensions(const std::string &value, AnalyzeOptions &options) {
  for (auto extension : SplitList(value)) {
    if (extension.front() != '.') {
      extension.insert(extension.begin(), '.');
    }
    AppendUnique(std::move(extension), options.extensions);
  }
}

void AddIgnoredPaths(const std::string &value, AnalyzeOptions &options) {
  for (const auto &path : SplitList(value)) {
    AppendUnique(std::filesystem::path(path).generic_string(),
                 options.ignored_paths);
  }
}

void SetOutputDirectory(const std::string &value, AnalyzeOptions &options) {
  options.output_directory = value;
}

void SetConfigFile(const std::string &value, AnalyzeOptions &options) {
  options.config_file = value;
}

void SetLogLevel(const std::string &value, AnalyzeOptions &options) {
  options.log_level = shccn::ParseLogLevel(value);
}

void SetVerbose(const std::string &, AnalyzeOptions &options) {
  options.log_level = shccn::LogLevel::kInfo;
}

void SetDebug(const std::string &, AnalyzeOptions &options) {
  options.log_level = shccn::LogLevel::kDebug;
}

void SetAnalyzer(const std::string &value, AnalyzeOptions &options) {
  options.analyzer = value;
}

void SetReporter(const std::string &value, AnalyzeOptions &options) {
  options.reporter = value;
}

void SetHelp(const std::string &, AnalyzeOptions &options) {
  options.show_help = true;
}

// One entry per option. `flag` is null for config-only settings and
// `config_key` is null for command-line-only ones. Switches have no
// `value_name` and receive an empty value.
struct Setting {
  const char *flag;
  const char *config_key;
  const char *value_name;
  const char *help;
  void (*apply)(const std::string &value, AnalyzeOptions &options);
  bool accepts_list;
};

const std::vector<Setting> &Settings() {
  static const std::vector<Setting> settings = {
      {"--format", "formats", "<list>",
       "Comma-separated output formats: table, json (default: table)",
       AddFormats, true},
      {"--out", "out", "<dir>",
       "Write shccn_report.txt/.json there instead of stdout",
       SetOutputDirectory, false},
      {"--extensions", "extensions", "<list>",
       "Script extensions collected from directories (default: .sh,.bash)",
       AddExtensions, true},
      {"--ignored-paths", "ignored_paths", "<list>",
       "Paths skipped while walking directories", AddIgnoredPaths, true},
      {"--config", nullptr, "<file>", "YAML file with default options",
       SetConfigFile, false},
      {"--log-level", "log_level", "<level>",
       "error, warn, info or debug (default: warn)", SetLogLevel, false},
      {"--verbose", nullptr, nullptr, "Same as --log-level info", SetVerbose,
       false},
      {"--debug", nullptr, nullptr, "Same as --log-level debug", SetDebug,
       false},
      {"--analyzer", "analyzer", "<name>",
       "Metrics analyzer (default: heuristic)", SetAnalyzer, false},
      {"--reporter", "reporter", "<name>", "Report renderer (default: table)",
       SetReporter, false},
      {"--help", nullptr, nullptr, "Show this message", SetHelp, false},
      {nullptr, "inputs", nullptr, nullptr, AddInputs, true},
  };
  return settings;
}

const Setting *FindFlag(const std::string &flag) {
  const auto &settings = Settings();
  const auto found =
      std::find_if(settings.begin(), settings.end(), [&](const Setting &s) {
        return s.flag != nullptr && flag == s.flag;
      });
  return found == settings.end() ? nullptr : &*found;
}

const Setting *FindConfigKey(const std::string &key) {
  const auto &settings = Settings();
  const auto found =
      std::find_if(settings.begin(), settings.end(), [&](const Setting &s) {
        return s.config_key != nullptr && key == s.config_key;
      });
  return found == settings.end() ? nullptr : &*found;
}

std::string SupportedConfigKeys() {
  std::string keys;
  for (const auto &setting : Settings()) {
    if (setting.config_key != nullptr) {
      keys += keys.empty() ? "" : ", ";
      keys += setting.config_key;
    }
  }
  return keys;
}

void ApplyConfigValue(const Setting &setting, const std::string &key,
                      const YAML::Node &node, AnalyzeOptions &options) {
  if (node.IsScalar()) {
    setting.apply(node.as<std::string>(), options);
    return;
  }
  if (!setting.accepts_list) {
    throw std::invalid_argument("Config key '" + key + "' must be a string");
  }
  if (!node.IsSequence()) {
    throw std::invalid_argument("Config key '" + key +
                                "' must be a string or list of strings");
  }
  for (const auto &item : node) {
    if (!item.IsScalar()) {
      throw std::invalid_argument("Config key '" + key +
                                  "' must be a list of strings");
    }
    setting.apply(item.as<std::string>(), options);
  }
}

shccn::LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  shccn::LoggingConfig logging;
  logging.level = options.log_level.value_or(shccn::LogLevel::kWarn);
  return logging;
}

void WriteReport(const std::filesystem::path &path,
                 const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

void EmitReport(const AnalyzeOptions &options, const shccn::Report &report,
                std::ostream &output) {
  if (options.output_directory) {
    std::filesystem::create_directories(*options.output_directory);
    WriteReport(*options.output_directory / kTableReportName, report.table);
    WriteReport(*options.output_directory / kJsonReportName, report.json);
    return;
  }
  output << report.table;
  if (!report.json.empty()) {
    output << report.json << "\n";
  }
}

} // namespace

namespace shccn {

void PrintAnalyzeUsage(std::ostream &stream) {
  stream << "Usage: shccn [analyze] [options] <script-or-directory>...\n"
         << "Options:\n";
  for (const auto &setting : Settings()) {
    if (setting.flag == nullptr) {
      continue;
    }
    std::string name = setting.flag;
    if (setting.value_name != nullptr) {
      name = name + " " + setting.value_name;
    }
    name.resize(std::max(kUsageColumn, name.size() + 1), ' ');
    stream << "  " << name << setting.help << "\n";
  }
  stream << "Config file keys: " << SupportedConfigKeys() << "\n";
}

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size() && !options.show_help; ++i) {
    const auto &argument = arguments[i];
    if (argument.rfind('-', 0) != 0 || argument == "-") {
      AppendUnique(argument, options.inputs);
      continue;
    }
    const auto *setting = FindFlag(argument == "-h" ? "--help" : argument);
    if (setting == nullptr) {
      throw std::invalid_argument("Unknown argument: " + argument);
    }
    std::string value;
    if (setting->value_name != nullptr) {
      if (++i >= arguments.size()) {
        throw std::invalid_argument(argument + " requires a value");
      }
      value = arguments[i];
    }
    setting->apply(value, options);
  }
  return options;
}

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = path.extension().string();
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  AnalyzeOptions options;
  for (const auto &entry : root) {
    const auto key = entry.first.as<std::string>();
    const auto *setting = FindConfigKey(key);
    if (setting == nullptr) {
      throw std::invalid_argument("Unknown config key: " + key +
                                  ". Supported keys: " + SupportedConfigKeys());
    }
    ApplyConfigValue(*setting, key, entry.second, options);
  }
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto take = [](auto &target, const auto &source) {
    if (!source.empty()) {
      target = source;
    }
  };
  const auto take_set = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  take(merged.inputs, cli_options.inputs);
  take(merged.formats, cli_options.formats);
  take(merged.extensions, cli_options.extensions);
  take(merged.ignored_paths, cli_options.ignored_paths);
  take_set(merged.output_directory, cli_options.output_directory);
  take_set(merged.config_file, cli_options.config_file);
  take_set(merged.log_level, cli_options.log_level);
  take_set(merged.analyzer, cli_options.analyzer);
  take_set(merged.reporter, cli_options.reporter);
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  const auto config_options = cli_options.config_file
                                  ? ParseConfigFile(*cli_options.config_file)
                                  : AnalyzeOptions{};
  auto merged = MergeOptions(config_options, cli_options);
  if (merged.inputs.empty()) {
    throw std::invalid_argument(
        "At least one script or directory is required (or set inputs in "
        "the config file)");
  }
  return merged;
}

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options) {
  AnalysisConfig config;
  config.inputs = options.inputs;
  if (!options.extensions.empty()) {
    config.extensions = options.extensions;
  }
  config.ignored_paths = options.ignored_paths;
  config.formats = options.formats.empty() ? std::vector<std::string>{"table"}
                                           : options.formats;
  return config;
}

int RunAnalyze(const std::vector<std::string> &arguments,
               std::ostream &output, std::ostream &log) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage(output);
    return kExitSuccess;
  }

  const auto options = ResolveAnalyzeOptions(cli_options);
  PipelineComponents components;
  components.logger = MakeLogger(BuildLoggingConfig(options), log);
  if (options.analyzer) {
    components.analyzer_name = *options.analyzer;
  }
  if (options.reporter) {
    components.reporter_name = *options.reporter;
  }

  auto pipeline = BuildPipeline(std::move(components));
  const auto result = pipeline.Run(BuildAnalysisConfig(options));
  EmitReport(options, result.report, output);
  return AnalysisExitCode(result.analysis);
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  return RunAnalyze(arguments, std::cout, std::clog);
}

} // namespace shccn
