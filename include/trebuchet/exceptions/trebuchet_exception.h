/***
 * Name: trebuchet::exceptions::TrebuchetException
 * Purpose: Root of every error trebuchet raises about its input.
 * Inputs: Message and, for errors tied to one line, its 1-based number
 * Outputs: Exception object; what() carries a "line N: " prefix when positioned
 * Theory of Operation: Derives from std::exception so main keeps a generic
 *   fallback handler. Line 0 marks a file-level error such as an unreadable input.
 */
#pragma once

#include <cstddef>
#include <exception>
#include <string>

namespace trebuchet {
namespace exceptions {

class TrebuchetException : public std::exception {
 public:
  ~TrebuchetException() noexcept override = default;
  const char* what() const noexcept override;

  /*** line_number: 1-based input line, or 0 for file-level errors. */
  std::size_t line_number() const noexcept { return line_number_; }

 protected:
  TrebuchetException(const std::string& msg, std::size_t line_number);

 private:
  std::string message_;
  std::size_t line_number_;
};

}  // namespace exceptions
}  // namespace trebuchet
