/***
 * Name: trebuchet::driver::FormatLineLog
 * Purpose: Render per-line values as plain text.
 * Inputs:
 *   - rows: one entry per input line
 * Outputs:
 *   - std::string: "line <n>: part1=<v> part2=<v>" lines
 */
#include "trebuchet/driver/app.h"

#include <sstream>
#include <string>
#include <vector>

namespace trebuchet::driver {

auto FormatLineLog(const std::vector<LineLogRow>& rows) -> std::string {
  std::ostringstream out;
  for (const auto& row : rows) {
    out << "line " << row.line_number << ':';
    if (row.part1) {
      out << " part1=" << *row.part1;
    }
    if (row.part2) {
      out << " part2=" << *row.part2;
    }
    out << '\n';
  }
  return out.str();
}

}  // namespace trebuchet::driver
