/***
 * Name: trebuchet::driver::detail::HandleLogPathArg
 * Purpose: Handle the --log-path=<dir> and --log-path <dir> option.
 * Inputs:
 *   - args: full argument vector
 *   - index: current index (advanced when the directory is the next argument)
 *   - argc: total argument count
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Supports both conjoined and spaced forms; an empty
 *   directory is rejected.
 */
#include "trebuchet/driver/cli_parse.h"
#include "trebuchet/driver/cli.h"  // direct use of CliOptions

#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace trebuchet {
namespace driver {
namespace detail {

auto HandleLogPathArg(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err) -> OptResult {
  constexpr std::string_view kFlag{"--log-path"};
  const std::string& arg = args[static_cast<std::size_t>(index)];
  if (arg.rfind(kFlag, 0) != 0U) {
    return OptResult::NotMatched;
  }
  std::string value;
  if (arg.size() == kFlag.size()) {
    if (index + 1 >= argc) {
      err << "trebuchet: error: missing directory after '--log-path'" << '\n';
      return OptResult::Error;
    }
    ++index;
    value = args[static_cast<std::size_t>(index)];
  } else if (arg[kFlag.size()] == '=') {
    value = arg.substr(kFlag.size() + 1);
  } else {
    return OptResult::NotMatched;
  }
  if (value.empty()) {
    err << "trebuchet: error: empty directory for '--log-path'" << '\n';
    return OptResult::Error;
  }
  dst.log_path = value;
  return OptResult::Handled;
}

}  // namespace detail
}  // namespace driver
}  // namespace trebuchet
