/***
 * Name: trebuchet::exceptions::TrebuchetException
 * Purpose: Format and expose the positioned error message.
 * Inputs:
 *   - msg: description without position
 *   - line_number: 1-based line, or 0
 * Outputs: Initialized exception object; what() valid for its lifetime
 */
#include "trebuchet/exceptions/trebuchet_exception.h"

#include <cstddef>
#include <string>

namespace trebuchet::exceptions {

TrebuchetException::TrebuchetException(const std::string& msg, std::size_t line_number)
    : message_(line_number == 0U ? msg : "line " + std::to_string(line_number) + ": " + msg),
      line_number_(line_number) {}

auto TrebuchetException::what() const noexcept -> const char* { return message_.c_str(); }

}  // namespace trebuchet::exceptions
