/***
 * Name: trebuchet::tests::Exceptions
 * Purpose: Validate positioned messages and catchability through the base class.
 * Inputs: none
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <exception>
#include <string>

#include "trebuchet/exceptions/file_read_error.h"
#include "trebuchet/exceptions/no_digits_error.h"
#include "trebuchet/exceptions/trebuchet_exception.h"

using namespace trebuchet::exceptions;

TEST(Exceptions, PositionedErrorPrefixesLine) {
  const NoDigitsError ex(7, "abc");
  EXPECT_EQ(7u, ex.line_number());
  EXPECT_EQ("abc", ex.line_text());
  EXPECT_STREQ("line 7: no numeral found in line", ex.what());
}

TEST(Exceptions, UnpositionedErrorHasNoPrefix) {
  const NoDigitsError ex(0, "");
  EXPECT_STREQ("no numeral found in line", ex.what());
  const FileReadError read_err("failed to open file: x.txt");
  EXPECT_EQ(0u, read_err.line_number());
  EXPECT_STREQ("failed to open file: x.txt", read_err.what());
}

TEST(Exceptions, CaughtAsBaseAndStdException) {
  try {
    throw NoDigitsError(3, "xyz");
  } catch (const TrebuchetException& ex) {
    EXPECT_EQ(3u, ex.line_number());
  }
  try {
    throw FileReadError("input is a directory: /tmp");
  } catch (const std::exception& ex) {
    EXPECT_EQ(std::string("input is a directory: /tmp"), ex.what());
  }
}
