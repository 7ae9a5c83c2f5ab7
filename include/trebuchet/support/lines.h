/***
 * Name: trebuchet::support::SplitLines
 * Purpose: Break file contents into text lines.
 * Inputs: Whole-file text
 * Outputs: Lines without terminators
 * Theory of Operation: Splits on '\n' and drops one trailing '\r' per line. A
 *   final terminator does not start an extra empty line; blank lines in the
 *   middle are kept.
 */
#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace trebuchet {
namespace support {

std::vector<std::string> SplitLines(std::string_view text);

}  // namespace support
}  // namespace trebuchet
