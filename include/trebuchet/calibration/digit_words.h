/***
 * Name: trebuchet::calibration (digit words)
 * Purpose: The fixed table of spelled-out digit words and their values.
 * Inputs: N/A (constant data)
 * Outputs: kDigitWords, indexed by value
 * Theory of Operation: Entry i spells the digit i, so the table doubles as a
 *   value lookup. Shared by the word digitizer and the token scanner.
 */
#pragma once

#include <array>
#include <string_view>

namespace trebuchet {
namespace calibration {

struct DigitWord {
  std::string_view word;
  int value;
};

inline constexpr std::array<DigitWord, 10> kDigitWords{{
    {"zero", 0},
    {"one", 1},
    {"two", 2},
    {"three", 3},
    {"four", 4},
    {"five", 5},
    {"six", 6},
    {"seven", 7},
    {"eight", 8},
    {"nine", 9},
}};

/*** kDigitMarker: Delimits a numeral injected by DigitizeWords; never part of a text line. */
inline constexpr char kDigitMarker = '\0';

/*** IsNumeral: True for ASCII '0'..'9'. */
constexpr bool IsNumeral(char ch) { return ch >= '0' && ch <= '9'; }

}  // namespace calibration
}  // namespace trebuchet
