#ifndef TREBUCHET_DIAGNOSTICS_DIAGNOSTIC_H
#define TREBUCHET_DIAGNOSTICS_DIAGNOSTIC_H

/***
 * Name: trebuchet::diagnostics
 * Purpose: Compiler-style error reports for problems located in the input file.
 * Inputs:
 *   - Diagnostic records built by the driver
 * Outputs:
 *   - "file:line:col: error: message" plus the source line and a caret
 * Theory of Operation:
 *   The record carries the source line itself, so printing never re-reads the
 *   input. Color is opt-in through the TREBUCHET_COLOR environment variable.
 */

#include <iosfwd>
#include <string>

namespace trebuchet {
namespace diagnostics {

struct Diagnostic {
  std::string file;
  int line{0};
  int col{0};
  std::string message;
  std::string source_line;
};

void PrintDiagnostic(std::ostream &out, const Diagnostic &diag, bool color);

bool UseEnvColor();

} // namespace diagnostics
} // namespace trebuchet

#endif // TREBUCHET_DIAGNOSTICS_DIAGNOSTIC_H
