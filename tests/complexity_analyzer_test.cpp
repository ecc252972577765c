#include <shccn/complexity_analyzer.h>

#include <gtest/gtest.h>

namespace shccn {
namespace {

TEST(ComplexityAnalyzerTest, EmptyBodyHasBaselineComplexity) {
  EXPECT_EQ(1, ComputeCcn({}));
  EXPECT_EQ(1, ComputeCcn({"echo hi", "return 0"}));
}

TEST(ComplexityAnalyzerTest, CountsIfStatement) {
  EXPECT_EQ(2, ComputeCcn({"if [ -z \"$x\" ]; then", "echo hi", "fi"}));
}

TEST(ComplexityAnalyzerTest, CountsLoopsAndCaseBranches) {
  EXPECT_EQ(2, ComputeCcn({"while read line; do", "done"}));
  EXPECT_EQ(2, ComputeCcn({"for f in *; do", "done"}));
  EXPECT_EQ(3, ComputeCcn({"case $1 in", "a) echo a ;;", "b) echo b ;;",
                           "esac"}));
}

TEST(ComplexityAnalyzerTest, CountsEachLogicalOperatorToken) {
  EXPECT_EQ(2, ComputeCcn({"[ $a ] && [ $b ]"}));
  EXPECT_EQ(3, ComputeCcn({"[ $a ] && [ $b ] || [ $c ]"}));
}

TEST(ComplexityAnalyzerTest, OperatorsInsideOneTokenCountOnce) {
  EXPECT_EQ(1, LogicalOperatorIncrement("true&&false||true"));
  EXPECT_EQ(2, LogicalOperatorIncrement("a &&  b ||"));
}

TEST(ComplexityAnalyzerTest, KeywordAndOperatorsAddUp) {
  EXPECT_EQ(3, ComputeCcn({"if [ $a ] && [ $b ]; then", "fi"}));
}

TEST(ComplexityAnalyzerTest, KeywordCountsOncePerLine) {
  EXPECT_EQ(1, BranchIncrement("if true; then if true; then :; fi; fi"));
}

TEST(ComplexityAnalyzerTest, KeywordInsideQuotesIsIgnored) {
  EXPECT_EQ(1, ComputeCcn({"echo \"if this then that\""}));
  EXPECT_EQ(1, ComputeCcn({"echo 'waiting for input'"}));
}

TEST(ComplexityAnalyzerTest, KeywordSubstringsCount) {
  EXPECT_EQ(1, BranchIncrement("diff a b"));
  EXPECT_EQ(1, BranchIncrement("format_output"));
}

TEST(ComplexityAnalyzerTest, QuotedCaseTerminatorStillCounts) {
  EXPECT_EQ(1, BranchIncrement("echo ';;'"));
}

TEST(ComplexityAnalyzerTest, KeywordBeforeQuoteCounts) {
  EXPECT_EQ(1, BranchIncrement("if [ \"$x\" = y ]; then"));
  EXPECT_EQ(0, BranchIncrement("echo \"done\"; for f in *; do"));
}

TEST(ComplexityAnalyzerTest, VeryLongLinesAreScored) {
  const std::string payload(60000, 'A');

  EXPECT_EQ(0, BranchIncrement("echo '" + payload + " while'"));
  EXPECT_EQ(1, BranchIncrement("if [ -n '" + payload + "' ]; then"));
  EXPECT_EQ(1, LogicalOperatorIncrement(payload + "&&" + payload));
}

} // namespace
} // namespace shccn
