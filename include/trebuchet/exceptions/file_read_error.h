/***
 * Name: trebuchet::exceptions::FileReadError
 * Purpose: The input file could not be loaded (missing, a directory, I/O error).
 * Inputs: Message from support::ReadFile, which already names the path
 * Outputs: File-level exception (line_number() == 0)
 */
#pragma once

#include <string>

#include "trebuchet/exceptions/trebuchet_exception.h"

namespace trebuchet {
namespace exceptions {

class FileReadError : public TrebuchetException {
 public:
  explicit FileReadError(const std::string& msg) : TrebuchetException(msg, 0) {}
};

}  // namespace exceptions
}  // namespace trebuchet
