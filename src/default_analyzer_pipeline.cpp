#include <shccn/default_analyzer_pipeline.h>

#include <shccn/script_loader.h>
#include <shccn/script_source_acquirer.h>

#include <chrono>
#include <string>
#include <utility>

namespace shccn {

DefaultAnalyzerPipeline::DefaultAnalyzerPipeline(PipelineComponents components)
    : source_acquirer_(std::move(components.source_acquirer)),
      loader_(std::move(components.loader)),
      analyzer_(std::move(components.analyzer)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))) {}

PipelineResult DefaultAnalyzerPipeline::Run(const AnalysisConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"inputs", std::to_string(config.inputs.size())},
                {"formats", std::to_string(config.formats.size())}});

  const auto pipeline_start = std::chrono::steady_clock::now();
  const auto sources = source_acquirer_->Acquire(config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "source"},
                {"file_count", std::to_string(sources.files.size())}});

  AnalysisResult analysis;
  analysis.failures = sources.failures;
  for (const auto &path : sources.files) {
    try {
      const auto source = loader_->Load(path);
      auto metrics = analyzer_->Analyze(source);
      logger_->Log(LogLevel::kDebug, "pipeline.script.complete",
                   {{"path", path},
                    {"lines", std::to_string(metrics.file.line_count)},
                    {"functions", std::to_string(metrics.functions.size())}});
      analysis.scripts.push_back(std::move(metrics));
    } catch (const ScriptReadError &error) {
      logger_->Log(LogLevel::kWarn, "pipeline.script.unreadable",
                   {{"path", path}, {"error", error.what()}});
      analysis.failures.push_back(ReadFailure{path, error.Reason()});
    }
  }
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "analyze"},
                {"scripts", std::to_string(analysis.scripts.size())},
                {"failures", std::to_string(analysis.failures.size())}});

  auto report = reporter_->Render(analysis, config);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"failures", std::to_string(analysis.failures.size())}});

  return PipelineResult{std::move(report), std::move(analysis)};
}

DefaultAnalyzerPipeline BuildPipeline(PipelineComponents components,
                                      const ComponentRegistry &registry) {
  components.logger = EnsureLogger(std::move(components.logger));
  if (!components.source_acquirer) {
    components.source_acquirer =
        std::make_unique<ScriptSourceAcquirer>(components.logger);
  }
  if (!components.loader) {
    components.loader = std::make_unique<FileScriptLoader>();
  }
  if (!components.analyzer) {
    components.analyzer = registry.MakeAnalyzer(components.analyzer_name);
  }
  if (!components.reporter) {
    components.reporter = registry.MakeReporter(components.reporter_name);
  }
  return DefaultAnalyzerPipeline(std::move(components));
}

} // namespace shccn
