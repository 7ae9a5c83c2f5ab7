/***
 * Name: trebuchet::calibration::DigitizeWords
 * Purpose: Make spelled-out digit words visible to the numeral extractor.
 * Inputs:
 *   - line: one text line
 *   - inserted: optional out count of numerals injected
 * Outputs: Rewritten line
 * Theory of Operation: For every start position of every kDigitWords entry
 *   (overlaps included) a marker-delimited numeral is inserted in front of the
 *   match. Original characters are never removed, so "twone" still exposes both
 *   "two" and "one". Matching is done against the input line, not the growing
 *   output buffer, which keeps the result independent of table order.
 */
#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace trebuchet {
namespace calibration {

std::string DigitizeWords(std::string_view line, std::size_t* inserted = nullptr);

/*** CountDigitWords: Number of digit-word matches in line, overlaps included. */
std::size_t CountDigitWords(std::string_view line);

}  // namespace calibration
}  // namespace trebuchet
