/***
 * Name: trebuchet::support::SplitLines
 * Purpose: Split text into lines, tolerating CRLF and a final terminator.
 * Inputs:
 *   - text: whole-file contents
 * Outputs:
 *   - std::vector<std::string>: one entry per line
 */
#include "trebuchet/support/lines.h"

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

namespace trebuchet::support {

auto SplitLines(std::string_view text) -> std::vector<std::string> {
  std::vector<std::string> lines;
  std::size_t start = 0;
  while (start < text.size()) {
    std::size_t end = text.find('\n', start);
    if (end == std::string_view::npos) {
      end = text.size();
    }
    std::string_view line = text.substr(start, end - start);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }
    lines.emplace_back(line);
    start = end + 1;
  }
  return lines;
}

}  // namespace trebuchet::support
