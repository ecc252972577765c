#pragma once

#include <shccn/interfaces.h>

#include <functional>
#include <map>
#include <memory>
#include <string>

namespace shccn {

inline constexpr const char kDefaultAnalyzerName[] = "heuristic";
inline constexpr const char kDefaultReporterName[] = "table";

// Analyzers and reporters selectable by name with --analyzer and --reporter.
class ComponentRegistry {
public:
  using AnalyzerFactory = std::function<std::unique_ptr<MetricsAnalyzer>()>;
  using ReporterFactory = std::function<std::unique_ptr<Reporter>()>;

  // Throws std::invalid_argument for an empty name, a null factory or a name
  // that is already taken.
  void AddAnalyzer(const std::string &name, AnalyzerFactory factory);
  void AddReporter(const std::string &name, ReporterFactory factory);

  // Throws std::invalid_argument naming the registered entries when `name` is
  // unknown.
  std::unique_ptr<MetricsAnalyzer> MakeAnalyzer(const std::string &name) const;
  std::unique_ptr<Reporter> MakeReporter(const std::string &name) const;

private:
  std::map<std::string, AnalyzerFactory> analyzers_;
  std::map<std::string, ReporterFactory> reporters_;
};

// Holds the heuristic analyzer and the table reporter.
const ComponentRegistry &BuiltinComponents();

} // namespace shccn
