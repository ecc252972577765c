#pragma once

#include <shccn/interfaces.h>

#include <vector>

namespace shccn {

FileMetrics ComputeFileMetrics(const SourceFile &source);
std::vector<FunctionMetrics> ComputeFunctionMetrics(const SourceFile &source);

class HeuristicMetricsAnalyzer : public MetricsAnalyzer {
public:
  ScriptMetrics Analyze(const SourceFile &source) override;
};

} // namespace shccn
