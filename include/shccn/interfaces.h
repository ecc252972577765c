#pragma once

#include <shccn/models.h>

#include <string>

namespace shccn {

class SourceAcquirer {
public:
  virtual ~SourceAcquirer() = default;
  virtual SourceAcquisitionResult Acquire(const AnalysisConfig &config) = 0;
};

class ScriptLoader {
public:
  virtual ~ScriptLoader() = default;
  virtual SourceFile Load(const std::string &path) = 0;
};

class MetricsAnalyzer {
public:
  virtual ~MetricsAnalyzer() = default;
  virtual ScriptMetrics Analyze(const SourceFile &source) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const AnalysisResult &analysis,
                        const AnalysisConfig &config) = 0;
};

class AnalyzerPipeline {
public:
  virtual ~AnalyzerPipeline() = default;
  virtual PipelineResult Run(const AnalysisConfig &config) = 0;
};

} // namespace shccn
