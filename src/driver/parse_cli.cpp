/***
 * Name: trebuchet::driver::ParseCli
 * Purpose: Parse command-line arguments into a CliOptions structure.
 * Inputs:
 *   - argc: Argument count
 *   - argv: Argument vector
 *   - dst: Output options structure to populate
 *   - err: Stream for diagnostics on parse errors
 * Outputs:
 *   - bool: true on successful parse, false if an error occurs
 * Theory of Operation:
 *   Copies argv, feeds each argument through detail::RunHandlers and stops
 *   early on help. The input handler rejects a second file as soon as it
 *   appears; a missing file is detected here, after the last argument.
 */
#include "trebuchet/driver/cli.h"
#include "trebuchet/driver/cli_parse.h"

#include <ostream>
#include <string>
#include <vector>

namespace trebuchet::driver {

auto ParseCli(int argc, const char* const* argv, CliOptions& dst, std::ostream& err) -> bool {
  // Reset to defaults
  dst = CliOptions{};

  const std::vector<std::string> args(argv, argv + argc);  // NOLINT(*-pro-bounds-pointer-arithmetic)
  for (int arg_index = 1; arg_index < argc; ++arg_index) {
    if (detail::RunHandlers(args, arg_index, argc, dst, err) == detail::OptResult::Error) {
      return false;
    }
    if (dst.show_help) {
      return true;
    }
  }

  if (dst.inputs.empty()) {
    err << "trebuchet: error: no input file" << '\n';
    return false;
  }
  return true;
}

}  // namespace trebuchet::driver
