/***
 * Name: trebuchet::driver::PrintUsage
 * Purpose: Print CLI usage information for trebuchet.
 * Inputs:
 *   - out: Destination stream
 *   - argv0: Program name used in usage examples
 * Outputs: None
 */
#include "trebuchet/driver/cli.h"

#include <cstring>
#include <ostream>
#include <string_view>

namespace trebuchet::driver {

static std::string_view Basename(const char* path) {
  if (path == nullptr || *path == '\0') {
    return std::string_view{"trebuchet"};
  }
  const char* last_slash = std::strrchr(path, '/');
  return std::string_view(last_slash != nullptr ? last_slash + 1 : path);
}

auto PrintUsage(std::ostream& out, const char* argv0) -> void {
  const std::string_view program_name = Basename(argv0);
  out << "Usage: " << program_name << " [options] file" << '\n'
      << '\n'
      << "Sums the two-digit calibration value (first and last digit) of every line." << '\n'
      << '\n'
      << "Options:" << '\n'
      << "  -h, --help               Print this help and exit" << '\n'
      << "  --part=1|2               Print only Part 1 (numerals) or Part 2 (numerals and words)" << '\n'
      << "  --strategy=rewrite|scan  How Part 2 finds digit words (default: rewrite)" << '\n'
      << "  --metrics[=json|text]    Print timing and counter metrics (default: text)" << '\n'
      << "  --log-path=<dir>         Write per-line values to a timestamped log in <dir>" << '\n'
      << "  --                       End of options" << '\n'
      << '\n'
      << "Environment:" << '\n'
      << "  TREBUCHET_COLOR=1        Colorize diagnostics" << '\n';
}

}  // namespace trebuchet::driver
