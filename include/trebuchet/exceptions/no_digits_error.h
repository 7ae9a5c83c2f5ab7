/***
 * Name: trebuchet::exceptions::NoDigitsError
 * Purpose: A line yields no numeral after all processing.
 * Inputs: Line number (1-based, 0 when the caller has no position) and the line text
 * Outputs: Exception whose what() reads "line N: no numeral found in line"
 * Theory of Operation: Keeps the raw line so the driver can print it under a
 *   file:line diagnostic with a caret.
 */
#pragma once

#include <cstddef>
#include <string>

#include "trebuchet/exceptions/trebuchet_exception.h"

namespace trebuchet {
namespace exceptions {

class NoDigitsError : public TrebuchetException {
 public:
  NoDigitsError(std::size_t line_number, std::string line_text);

  const std::string& line_text() const noexcept { return line_text_; }

 private:
  std::string line_text_;
};

}  // namespace exceptions
}  // namespace trebuchet
