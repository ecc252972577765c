#include <shccn/table_reporter.h>

#include <sstream>
#include <string>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace shccn {
namespace {

using ::testing::HasSubstr;

AnalysisResult SampleAnalysis() {
  AnalysisResult analysis;
  ScriptMetrics script;
  script.file = FileMetrics{"deploy.sh", 12, 8, 2, 2, 1};
  script.functions = {FunctionMetrics{"BARE_CODE", 3, 1},
                      FunctionMetrics{"deploy", 5, 3}};
  analysis.scripts.push_back(script);
  return analysis;
}

std::vector<std::string> SplitLines(const std::string &text) {
  std::vector<std::string> lines;
  std::istringstream stream(text);
  std::string line;
  while (std::getline(stream, line)) {
    lines.push_back(line);
  }
  return lines;
}

TEST(TableReporterTest, SummaryTableUsesFixedColumns) {
  const auto lines = SplitLines(BuildSummaryTable(SampleAnalysis().scripts));

  ASSERT_EQ(5u, lines.size());
  EXPECT_EQ(std::string(80, '-'), lines[0]);
  EXPECT_EQ("Name                      Lines       Code   Comments     Blanks"
            "  Functions",
            lines[1]);
  EXPECT_EQ(std::string(80, '-'), lines[2]);
  EXPECT_EQ("deploy.sh                    12          8          2          2"
            "          1",
            lines[3]);
  EXPECT_EQ(std::string(80, '-'), lines[4]);
}

TEST(TableReporterTest, FunctionTableQualifiesNamesWithFile) {
  const auto lines = SplitLines(BuildFunctionTable(SampleAnalysis().scripts));

  ASSERT_EQ(6u, lines.size());
  EXPECT_EQ("Name                                           Code                 "
            " CCN",
            lines[1]);
  EXPECT_EQ("BARE_CODE@deploy.sh                               3               "
            "     1",
            lines[3]);
  EXPECT_EQ("deploy@deploy.sh                                  5               "
            "     3",
            lines[4]);
}

TEST(TableReporterTest, DefaultsToTableOnly) {
  TableReporter reporter;

  const auto report = reporter.Render(SampleAnalysis(), AnalysisConfig{});

  EXPECT_THAT(report.table, HasSubstr("deploy@deploy.sh"));
  EXPECT_TRUE(report.json.empty());
}

TEST(TableReporterTest, RendersJsonWhenRequested) {
  TableReporter reporter;
  AnalysisConfig config;
  config.formats = {"json"};
  auto analysis = SampleAnalysis();
  analysis.failures.push_back(ReadFailure{"gone.sh", "no such file"});

  const auto report = reporter.Render(analysis, config);

  EXPECT_TRUE(report.table.empty());
  EXPECT_THAT(report.json,
              HasSubstr("{\"name\": \"deploy.sh\",\"lines\": 12,\"code\": 8,"
                        "\"comments\": 2,\"blanks\": 2,\"functions\": 1}"));
  EXPECT_THAT(report.json,
              HasSubstr("{\"name\": \"deploy\",\"file\": \"deploy.sh\","
                        "\"code\": 5,\"ccn\": 3}"));
  EXPECT_THAT(report.json,
              HasSubstr("\"failures\": [{\"path\": \"gone.sh\",\"reason\": "
                        "\"no such file\"}]"));
}

TEST(TableReporterTest, JsonEscapesControlCharactersInNames) {
  TableReporter reporter;
  AnalysisConfig config;
  config.formats = {"json"};
  AnalysisResult analysis;
  ScriptMetrics script;
  script.file.name = "odd.sh";
  script.functions = {FunctionMetrics{"\fpaint\x1b[0m\t\"x\"", 1, 1}};
  analysis.scripts.push_back(script);

  const auto report = reporter.Render(analysis, config);

  EXPECT_THAT(report.json, HasSubstr("\"name\": "
                                     "\"\\u000cpaint\\u001b[0m\\t\\\"x\\\"\""));
}

TEST(TableReporterTest, ListsReadFailuresAfterTables) {
  TableReporter reporter;
  AnalysisResult analysis;
  analysis.failures.push_back(ReadFailure{"gone.sh", "no such file"});

  const auto report = reporter.Render(analysis, AnalysisConfig{});

  EXPECT_THAT(report.table, HasSubstr("error: gone.sh: no such file\n"));
}

} // namespace
} // namespace shccn
