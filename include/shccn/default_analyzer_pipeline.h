#pragma once

#include <shccn/component_registry.h>
#include <shccn/interfaces.h>
#include <shccn/logging.h>

#include <memory>
#include <string>

namespace shccn {

// Parts of a pipeline. Any part left empty is filled in by BuildPipeline.
struct PipelineComponents {
  std::unique_ptr<SourceAcquirer> source_acquirer;
  std::unique_ptr<ScriptLoader> loader;
  std::unique_ptr<MetricsAnalyzer> analyzer;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
  std::string analyzer_name = kDefaultAnalyzerName;
  std::string reporter_name = kDefaultReporterName;
};

// Loads and analyzes one script at a time. A script that cannot be read is
// recorded as a failure and the rest of the batch carries on.
class DefaultAnalyzerPipeline : public AnalyzerPipeline {
public:
  explicit DefaultAnalyzerPipeline(PipelineComponents components);

  PipelineResult Run(const AnalysisConfig &config) override;

private:
  std::unique_ptr<SourceAcquirer> source_acquirer_;
  std::unique_ptr<ScriptLoader> loader_;
  std::unique_ptr<MetricsAnalyzer> analyzer_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
};

// Missing acquirer and loader default to the filesystem ones; a missing
// analyzer or reporter is made from `registry` by name.
DefaultAnalyzerPipeline
BuildPipeline(PipelineComponents components = {},
              const ComponentRegistry &registry = BuiltinComponents());

} // namespace shccn
