/***
 * Name: trebuchet::exceptions::NoDigitsError::NoDigitsError
 * Purpose: Construct the error for one digit-less line.
 * Inputs:
 *   - line_number: 1-based line index, or 0 when the caller has no position
 *   - line_text: raw text of the offending line
 * Outputs: Initialized exception object
 */
#include "trebuchet/exceptions/no_digits_error.h"

#include <cstddef>
#include <string>
#include <utility>

namespace trebuchet::exceptions {

NoDigitsError::NoDigitsError(std::size_t line_number, std::string line_text)
    : TrebuchetException("no numeral found in line", line_number), line_text_(std::move(line_text)) {}

}  // namespace trebuchet::exceptions
