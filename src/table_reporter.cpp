#include <shccn/table_reporter.h>

#include <algorithm>
#include <iomanip>
#include <initializer_list>
#include <sstream>
#include <unordered_map>

namespace shccn {
namespace {

const std::string &Separator() {
  static const std::string separator(80, '-');
  return separator;
}

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  static constexpr char kHexDigits[] = "0123456789abcdef";

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    const auto byte = static_cast<unsigned char>(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (byte < 0x20) {
      escaped.append("\\u00");
      escaped.push_back(kHexDigits[byte >> 4]);
      escaped.push_back(kHexDigits[byte & 0x0f]);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "table";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string BuildFailuresText(const std::vector<ReadFailure> &failures) {
  std::ostringstream section;
  for (const auto &failure : failures) {
    section << "error: " << failure.path << ": " << failure.reason << "\n";
  }
  return section.str();
}

std::string BuildFilesJson(const std::vector<ScriptMetrics> &scripts) {
  std::ostringstream json;
  json << "\"files\": [";
  for (std::size_t i = 0; i < scripts.size(); ++i) {
    const auto &file = scripts[i].file;
    if (i > 0) {
      json << ",";
    }
    json << "{\"name\": \"" << EscapeJsonString(file.name) << "\",";
    json << "\"lines\": " << file.line_count << ",";
    json << "\"code\": " << file.code_count << ",";
    json << "\"comments\": " << file.comment_count << ",";
    json << "\"blanks\": " << file.blank_count << ",";
    json << "\"functions\": " << file.function_count << "}";
  }
  json << "]";
  return json.str();
}

std::string BuildFunctionsJson(const std::vector<ScriptMetrics> &scripts) {
  std::ostringstream json;
  json << "\"functions\": [";
  bool first = true;
  for (const auto &script : scripts) {
    for (const auto &function : script.functions) {
      if (!first) {
        json << ",";
      }
      first = false;
      json << "{\"name\": \"" << EscapeJsonString(function.name) << "\",";
      json << "\"file\": \"" << EscapeJsonString(script.file.name) << "\",";
      json << "\"code\": " << function.code_line_count << ",";
      json << "\"ccn\": " << function.ccn << "}";
    }
  }
  json << "]";
  return json.str();
}

std::string BuildFailuresJson(const std::vector<ReadFailure> &failures) {
  std::ostringstream json;
  json << "\"failures\": [";
  for (std::size_t i = 0; i < failures.size(); ++i) {
    if (i > 0) {
      json << ",";
    }
    json << "{\"path\": \"" << EscapeJsonString(failures[i].path) << "\",";
    json << "\"reason\": \"" << EscapeJsonString(failures[i].reason) << "\"}";
  }
  json << "]";
  return json.str();
}

} // namespace

std::string BuildSummaryTable(const std::vector<ScriptMetrics> &scripts) {
  std::ostringstream table;
  table << Separator() << "\n";
  table << std::left << std::setw(20) << "Name" << std::right;
  for (const auto *column :
       {"Lines", "Code", "Comments", "Blanks", "Functions"}) {
    table << " " << std::setw(10) << column;
  }
  table << "\n" << Separator() << "\n";

  for (const auto &script : scripts) {
    const auto &file = script.file;
    table << std::left << std::setw(20) << file.name << std::right << " "
          << std::setw(10) << file.line_count << " " << std::setw(10)
          << file.code_count << " " << std::setw(10) << file.comment_count
          << " " << std::setw(10) << file.blank_count << " " << std::setw(10)
          << file.function_count << "\n";
  }
  table << Separator() << "\n";
  return table.str();
}

std::string BuildFunctionTable(const std::vector<ScriptMetrics> &scripts) {
  std::ostringstream table;
  table << Separator() << "\n";
  table << std::left << std::setw(30) << "Name" << std::right << " "
        << std::setw(20) << "Code" << " " << std::setw(20) << "CCN" << "\n";
  table << Separator() << "\n";

  for (const auto &script : scripts) {
    for (const auto &function : script.functions) {
      table << std::left << std::setw(30)
            << function.name + "@" + script.file.name << std::right << " "
            << std::setw(20) << function.code_line_count << " "
            << std::setw(20) << function.ccn << "\n";
    }
  }
  table << Separator() << "\n";
  return table.str();
}

Report TableReporter::Render(const AnalysisResult &analysis,
                             const AnalysisConfig &config) {
  Report report;

  if (ShouldRenderFormat(config.formats, "table")) {
    std::ostringstream output;
    output << BuildSummaryTable(analysis.scripts);
    output << BuildFunctionTable(analysis.scripts);
    output << BuildFailuresText(analysis.failures);
    report.table = output.str();
  }

  if (ShouldRenderFormat(config.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << BuildFilesJson(analysis.scripts) << ",";
    output << BuildFunctionsJson(analysis.scripts) << ",";
    output << BuildFailuresJson(analysis.failures);
    output << "}";
    report.json = output.str();
  }

  return report;
}

} // namespace shccn
