#include <shccn/line_classifier.h>

#include <gtest/gtest.h>

namespace shccn {
namespace {

TEST(LineClassifierTest, BlankLinesContainOnlySpaces) {
  EXPECT_TRUE(IsBlank(""));
  EXPECT_TRUE(IsBlank("   "));
  EXPECT_FALSE(IsBlank("\t"));
  EXPECT_FALSE(IsBlank("  echo"));
}

TEST(LineClassifierTest, FirstLineIsNeverAComment) {
  EXPECT_FALSE(IsComment("# comment", 0));
  EXPECT_FALSE(IsComment("#!/bin/bash", 0));
  EXPECT_TRUE(IsComment("# comment", 1));
}

TEST(LineClassifierTest, CommentsMayBeIndented) {
  EXPECT_TRUE(IsComment("    # indented", 3));
  EXPECT_TRUE(IsComment("\t# tabbed", 3));
  EXPECT_FALSE(IsComment("echo hi # trailing", 3));
  EXPECT_FALSE(IsComment("\v# vertical tab", 3));
}

TEST(LineClassifierTest, CommentPatternIgnoresLineIndex) {
  EXPECT_TRUE(MatchesCommentPattern("#!/bin/sh"));
  EXPECT_FALSE(MatchesCommentPattern("echo '#'"));
}

TEST(LineClassifierTest, ClassificationIsStable) {
  const std::string line = "  # again";
  EXPECT_EQ(IsComment(line, 2), IsComment(line, 2));
  EXPECT_EQ(IsBlank(line), IsBlank(line));
  EXPECT_EQ(IsFunctionStart(line), IsFunctionStart(line));
}

TEST(LineClassifierTest, StripSingleQuotedRemovesQuotedSegments) {
  EXPECT_EQ("echo  and ", StripSingleQuoted("echo 'a' and 'b'"));
  EXPECT_EQ("no quotes", StripSingleQuoted("no quotes"));
  EXPECT_EQ("echo ", StripSingleQuoted("echo 'unterminated {"));
  EXPECT_EQ("", StripSingleQuoted("''"));
}

TEST(LineClassifierTest, RecognizesFunctionDeclarations) {
  EXPECT_TRUE(IsFunctionStart("foo() {"));
  EXPECT_TRUE(IsFunctionStart("function foo () {"));
  EXPECT_TRUE(IsFunctionStart("foo ( ) {"));
  EXPECT_TRUE(IsFunctionStart("foo(){"));
  EXPECT_FALSE(IsFunctionStart("foo()"));
  EXPECT_FALSE(IsFunctionStart("echo {}"));
}

TEST(LineClassifierTest, QuotedDeclarationIdiomIsNotAFunction) {
  EXPECT_FALSE(IsFunctionStart("echo 'foo() {'"));
  EXPECT_FALSE(IsFunctionStart("echo \"foo() {\""));
}

TEST(LineClassifierTest, QuotedClosingBraceKeepsDeclaration) {
  EXPECT_TRUE(IsFunctionStart("foo() { echo '}'"));
  EXPECT_TRUE(IsFunctionStart("foo() { echo \"}\""));
}

TEST(LineClassifierTest, DeclarationParenthesesMayHoldWhitespace) {
  EXPECT_TRUE(IsFunctionStart("foo(\t)\f{"));
  EXPECT_TRUE(IsFunctionStart("(x) ( ) {"));
  EXPECT_FALSE(IsFunctionStart("foo( x ) {"));
  EXPECT_FALSE(IsFunctionStart("foo(\v) {"));
}

TEST(LineClassifierTest, VeryLongLinesAreClassified) {
  const std::string padding(200000, ' ');

  EXPECT_TRUE(IsComment(padding + "# note", 1));
  EXPECT_FALSE(IsComment(padding + "echo", 1));
  EXPECT_TRUE(IsFunctionStart("f(" + padding + ")" + padding + "{"));
  EXPECT_FALSE(IsFunctionStart("f(" + padding + ")" + padding));
  EXPECT_FALSE(IsFunctionStart("echo '" + std::string(200000, 'A') + "'"));
}

} // namespace
} // namespace shccn
