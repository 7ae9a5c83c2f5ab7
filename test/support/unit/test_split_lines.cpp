/***
 * Name: trebuchet::tests::SplitLines
 * Purpose: Validate line splitting for LF, CRLF, blank lines and final terminators.
 * Inputs: none
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "trebuchet/support/lines.h"

using trebuchet::support::SplitLines;
using Lines = std::vector<std::string>;

TEST(SplitLines, EmptyTextHasNoLines) {
  EXPECT_TRUE(SplitLines("").empty());
}

TEST(SplitLines, FinalNewlineDoesNotAddLine) {
  EXPECT_EQ((Lines{"1abc2", "treb7uchet"}), SplitLines("1abc2\ntreb7uchet\n"));
  EXPECT_EQ((Lines{"1abc2", "treb7uchet"}), SplitLines("1abc2\ntreb7uchet"));
}

TEST(SplitLines, CrlfIsStripped) {
  EXPECT_EQ((Lines{"two1nine", "7pqrstsixteen"}), SplitLines("two1nine\r\n7pqrstsixteen\r\n"));
}

TEST(SplitLines, BlankLinesInsideAreKept) {
  EXPECT_EQ((Lines{"a1", "", "b2"}), SplitLines("a1\n\nb2\n"));
  EXPECT_EQ((Lines{""}), SplitLines("\n"));
}
