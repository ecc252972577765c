#include <shccn/component_registry.h>

#include <shccn/metrics_aggregator.h>
#include <shccn/table_reporter.h>

#include <stdexcept>
#include <utility>

namespace shccn {
namespace {

void CheckRegistration(const std::string &name, bool has_factory,
                       bool taken) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!has_factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (taken) {
    throw std::invalid_argument("Component '" + name +
                                "' is already registered");
  }
}

template <typename Factories>
[[noreturn]] void ThrowUnknown(const char *kind, const std::string &name,
                               const Factories &factories) {
  std::string known;
  for (const auto &[registered, factory] : factories) {
    known += known.empty() ? registered : ", " + registered;
  }
  throw std::invalid_argument("Unknown " + std::string(kind) + " '" + name +
                              "'. Registered: " + known);
}

ComponentRegistry MakeBuiltinComponents() {
  ComponentRegistry registry;
  registry.AddAnalyzer(kDefaultAnalyzerName, []() {
    return std::make_unique<HeuristicMetricsAnalyzer>();
  });
  registry.AddReporter(kDefaultReporterName,
                       []() { return std::make_unique<TableReporter>(); });
  return registry;
}

} // namespace

void ComponentRegistry::AddAnalyzer(const std::string &name,
                                    AnalyzerFactory factory) {
  CheckRegistration(name, static_cast<bool>(factory),
                    analyzers_.count(name) != 0);
  analyzers_.emplace(name, std::move(factory));
}

void ComponentRegistry::AddReporter(const std::string &name,
                                    ReporterFactory factory) {
  CheckRegistration(name, static_cast<bool>(factory),
                    reporters_.count(name) != 0);
  reporters_.emplace(name, std::move(factory));
}

std::unique_ptr<MetricsAnalyzer>
ComponentRegistry::MakeAnalyzer(const std::string &name) const {
  const auto found = analyzers_.find(name);
  if (found == analyzers_.end()) {
    ThrowUnknown("analyzer", name, analyzers_);
  }
  return found->second();
}

std::unique_ptr<Reporter>
ComponentRegistry::MakeReporter(const std::string &name) const {
  const auto found = reporters_.find(name);
  if (found == reporters_.end()) {
    ThrowUnknown("reporter", name, reporters_);
  }
  return found->second();
}

const ComponentRegistry &BuiltinComponents() {
  static const ComponentRegistry registry = MakeBuiltinComponents();
  return registry;
}

} // namespace shccn
