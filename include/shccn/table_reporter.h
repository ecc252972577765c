#pragma once

#include <shccn/interfaces.h>

#include <string>
#include <vector>

namespace shccn {

std::string BuildSummaryTable(const std::vector<ScriptMetrics> &scripts);
std::string BuildFunctionTable(const std::vector<ScriptMetrics> &scripts);

class TableReporter : public Reporter {
public:
  Report Render(const AnalysisResult &analysis,
                const AnalysisConfig &config) override;
};

} // namespace shccn
