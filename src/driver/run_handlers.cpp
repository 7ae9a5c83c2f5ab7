/***
 * Name: trebuchet::driver::detail::RunHandlers
 * Purpose: Execute the ordered handler list for argument at 'index'.
 * Inputs: args, index (in/out), argc, dst, err
 * Outputs: OptResult (Error halts, Handled continues)
 * Theory of Operation: Table-driven dispatch in option-shape order: switches,
 *   value choices, --log-path, then the input handler, which never returns NotMatched.
 */
#include "trebuchet/driver/cli_parse.h"
#include "trebuchet/driver/cli.h"

#include <array>
#include <cstddef>
#include <functional>
#include <ostream>
#include <string>
#include <vector>

namespace trebuchet {
namespace driver {
namespace detail {

auto RunHandlers(const std::vector<std::string>& args,
                 int& index,
                 int argc,
                 CliOptions& dst,
                 std::ostream& err) -> OptResult {
  using HandlerFn = std::function<OptResult(int&)>;

  const std::array handlers{
      HandlerFn{[&](int& idx) { return HandleSwitchArg(args[static_cast<std::size_t>(idx)], dst); }},
      HandlerFn{[&](int& idx) { return HandleChoiceArg(args[static_cast<std::size_t>(idx)], dst, err); }},
      HandlerFn{[&](int& idx) { return HandleLogPathArg(args, idx, argc, dst, err); }},
      HandlerFn{[&](int& idx) { return HandleInputArg(args, idx, argc, dst, err); }},
  };

  for (const auto& handler : handlers) {
    const OptResult result = handler(index);
    if (result != OptResult::NotMatched) {
      return result;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace detail
}  // namespace driver
}  // namespace trebuchet
