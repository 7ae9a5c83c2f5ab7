/***
 * Name: trebuchet::tests::TokenScan
 * Purpose: Validate in-place numeral/word token scanning and its agreement with
 *   the digitize-then-extract path.
 * Inputs: none
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <cstddef>
#include <string>
#include <vector>

#include "trebuchet/calibration/edge_digits.h"
#include "trebuchet/calibration/token_scan.h"
#include "trebuchet/calibration/word_digitizer.h"

using namespace trebuchet::calibration;

TEST(TokenScan, WordExampleLines) {
  const std::vector<std::string> lines{"two1nine",        "eightwothree", "abcone2threexyz",
                                       "xtwone3four",     "4nineeightseven2", "zoneight234",
                                       "7pqrstsixteen"};
  const std::vector<int> expected{29, 83, 13, 24, 42, 14, 76};
  ASSERT_EQ(expected.size(), lines.size());
  for (std::size_t i = 0; i < lines.size(); ++i) {
    const auto edges = ScanTokenDigits(lines[i]);
    ASSERT_TRUE(edges.has_value()) << lines[i];
    EXPECT_EQ(expected[i], edges->Value()) << lines[i];
  }
}

TEST(TokenScan, LastTokenIsTheOneStartingRightmost) {
  const auto edges = ScanTokenDigits("3eightwo");
  ASSERT_TRUE(edges.has_value());
  EXPECT_EQ(3, edges->first);
  EXPECT_EQ(2, edges->last);
}

TEST(TokenScan, SingleWordIsDoubled) {
  const auto edges = ScanTokenDigits("xxsevenxx");
  ASSERT_TRUE(edges.has_value());
  EXPECT_EQ(77, edges->Value());
}

TEST(TokenScan, NoTokenIsEmptyOptional) {
  EXPECT_FALSE(ScanTokenDigits("").has_value());
  EXPECT_FALSE(ScanTokenDigits("abcdefg").has_value());
}

TEST(TokenScan, AgreesWithDigitizeThenExtract) {
  const std::vector<std::string> lines{"twone", "oneight", "1abc2", "nineeightseven",
                                       "fivezerofour", "sevenine", "qqthreeqq", "8"};
  for (const auto& line : lines) {
    const auto scanned = ScanTokenDigits(line);
    const auto rewritten = FindEdgeDigits(DigitizeWords(line));
    ASSERT_TRUE(scanned.has_value()) << line;
    ASSERT_TRUE(rewritten.has_value()) << line;
    EXPECT_EQ(rewritten->Value(), scanned->Value()) << line;
  }
}
