#include <shccn/metrics_aggregator.h>

#include <shccn/complexity_analyzer.h>
#include <shccn/function_extractor.h>
#include <shccn/line_classifier.h>

namespace shccn {

FileMetrics ComputeFileMetrics(const SourceFile &source) {
  const auto &lines = source.Lines();
  FileMetrics metrics;
  metrics.name = source.Name();
  metrics.line_count = lines.size();
  for (std::size_t i = 0; i < lines.size(); ++i) {
    if (IsBlank(lines[i])) {
      ++metrics.blank_count;
    }
    if (IsComment(lines[i], i)) {
      ++metrics.comment_count;
    }
    if (IsFunctionStart(lines[i])) {
      ++metrics.function_count;
    }
  }
  metrics.code_count =
      metrics.line_count - metrics.blank_count - metrics.comment_count;
  return metrics;
}

std::vector<FunctionMetrics> ComputeFunctionMetrics(const SourceFile &source) {
  const auto table = ExtractFunctions(CodeLines(source.Lines()));
  std::vector<FunctionMetrics> metrics;
  metrics.reserve(table.Size());
  for (const auto &function : table.Functions()) {
    metrics.push_back(FunctionMetrics{function.name, function.body.size(),
                                      ComputeCcn(function.body)});
  }
  return metrics;
}

ScriptMetrics HeuristicMetricsAnalyzer::Analyze(const SourceFile &source) {
  return ScriptMetrics{ComputeFileMetrics(source),
                       ComputeFunctionMetrics(source)};
}

} // namespace shccn
