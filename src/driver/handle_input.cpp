/***
 * Name: trebuchet::driver::detail::HandleInputArg
 * Purpose: Record the single input file, honoring "--".
 * Inputs:
 *   - args: full argument vector
 *   - index: current index (advanced to the end after "--")
 *   - argc: total argument count
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult::Error for an unknown option, an empty path or a second
 *   input; OptResult::Handled otherwise.
 * Theory of Operation: Last handler in RunHandlers. "--" turns every remaining
 *   token into an input, so a file named "-x" can still be processed.
 */
#include "trebuchet/driver/cli_parse.h"
#include "trebuchet/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace trebuchet::driver::detail {

static OptResult AddInput(const std::string& path, CliOptions& dst, std::ostream& err) {
  if (path.empty()) {
    err << "trebuchet: error: empty input file name" << '\n';
    return OptResult::Error;
  }
  if (!dst.inputs.empty()) {
    err << "trebuchet: error: exactly one input file is expected (got '" << dst.inputs.front() << "' and '"
        << path << "')" << '\n';
    return OptResult::Error;
  }
  dst.inputs.push_back(path);
  return OptResult::Handled;
}

auto HandleInputArg(const std::vector<std::string>& args,
                    int& index,
                    int argc,
                    CliOptions& dst,
                    std::ostream& err) -> OptResult {
  const std::string& arg = args[static_cast<std::size_t>(index)];
  if (arg == "--") {
    for (++index; index < argc; ++index) {
      if (AddInput(args[static_cast<std::size_t>(index)], dst, err) == OptResult::Error) {
        return OptResult::Error;
      }
    }
    return OptResult::Handled;
  }
  if (!arg.empty() && arg[0] == '-') {
    err << "trebuchet: error: unknown option '" << arg << "'" << '\n';
    return OptResult::Error;
  }
  return AddInput(arg, dst, err);
}

}  // namespace trebuchet::driver::detail
