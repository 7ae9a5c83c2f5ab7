/***
 * Name: trebuchet::tests::WordDigitizer
 * Purpose: Validate numeral injection for spelled-out digit words.
 * Inputs: none
 * Outputs: Pass/fail test results.
 * Theory of Operation: Compare DigitizeWords output against hand-built strings
 *   containing marker-delimited numerals, and check overlap handling by running
 *   the numeral extractor on the result.
 */
#include <gtest/gtest.h>

#include <cstddef>
#include <string>

#include "trebuchet/calibration/digit_words.h"
#include "trebuchet/calibration/edge_digits.h"
#include "trebuchet/calibration/word_digitizer.h"

using namespace trebuchet::calibration;

static std::string Token(char digit) {
  std::string tok;
  tok += kDigitMarker;
  tok += digit;
  tok += kDigitMarker;
  return tok;
}

TEST(WordDigitizer, LineWithoutWordsIsUnchanged) {
  std::size_t inserted = 99;
  EXPECT_EQ("pqr3stu8vwx", DigitizeWords("pqr3stu8vwx", &inserted));
  EXPECT_EQ(0u, inserted);
  EXPECT_EQ("", DigitizeWords(""));
}

TEST(WordDigitizer, KeepsWordAndInsertsNumeralInFront) {
  EXPECT_EQ(Token('2') + "two1" + Token('9') + "nine", DigitizeWords("two1nine"));
}

TEST(WordDigitizer, OverlappingWordsEachGetANumeral) {
  std::size_t inserted = 0;
  const std::string out = DigitizeWords("twone", &inserted);
  EXPECT_EQ(Token('2') + "tw" + Token('1') + "one", out);
  EXPECT_EQ(2u, inserted);
  EXPECT_EQ(21, ExtractEdgeNumber(out));
}

TEST(WordDigitizer, TokensFollowMatchStartOrder) {
  const std::string out = DigitizeWords("eightwothree");
  EXPECT_EQ(Token('8') + "eigh" + Token('2') + "two" + Token('3') + "three", out);
  EXPECT_EQ(83, ExtractEdgeNumber(out));
}

TEST(WordDigitizer, RecognizesZero) {
  EXPECT_EQ(Token('0') + "zero", DigitizeWords("zero"));
}

TEST(WordDigitizer, RepeatedWordMatchesEveryOccurrence) {
  std::size_t inserted = 0;
  const std::string out = DigitizeWords("oneone", &inserted);
  EXPECT_EQ(2u, inserted);
  EXPECT_EQ(Token('1') + "one" + Token('1') + "one", out);
}

TEST(WordDigitizer, PartialWordsAreIgnored) {
  std::size_t inserted = 0;
  EXPECT_EQ("on tw thre", DigitizeWords("on tw thre", &inserted));
  EXPECT_EQ(0u, inserted);
}

TEST(WordDigitizer, CaseSensitive) {
  EXPECT_EQ("ONE Two", DigitizeWords("ONE Two"));
}

TEST(WordDigitizer, SharedLettersAcrossManyWords) {
  // "oneight" = one + eight, "sevenine" = seven + nine
  EXPECT_EQ(18, ExtractEdgeNumber(DigitizeWords("oneight")));
  EXPECT_EQ(79, ExtractEdgeNumber(DigitizeWords("sevenine")));
  EXPECT_EQ(83, ExtractEdgeNumber(DigitizeWords("eighthree")));
}

TEST(WordDigitizer, CountMatchesInsertedTokens) {
  for (const char* line : {"twone", "oneone", "xtwone3four", "4nineeightseven2", "ONE Two", ""}) {
    std::size_t inserted = 0;
    (void)DigitizeWords(line, &inserted);
    EXPECT_EQ(inserted, CountDigitWords(line)) << line;
  }
  EXPECT_EQ(3u, CountDigitWords("zeroneight"));
}
