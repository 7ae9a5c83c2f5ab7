/***
 * Name: trebuchet::driver::detail::HandleSwitchArg
 * Purpose: Recognize the value-less switches: -h, --help and bare --metrics.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 * Outputs: Handled when matched, otherwise NotMatched
 * Theory of Operation: Exact lookup in a fixed table. "--metrics=<fmt>" is left
 *   to HandleChoiceArg.
 */
#include "trebuchet/driver/cli_parse.h"
#include "trebuchet/driver/cli.h"

#include <array>
#include <string>
#include <string_view>

namespace trebuchet::driver::detail {

namespace {

struct Switch {
  std::string_view name;
  void (*apply)(CliOptions&);
};

constexpr std::array<Switch, 3> kSwitches{{
    {"-h", [](CliOptions& o) { o.show_help = true; }},
    {"--help", [](CliOptions& o) { o.show_help = true; }},
    {"--metrics",
     [](CliOptions& o) {
       o.metrics = true;
       o.metrics_format = CliOptions::MetricsFormat::Text;
     }},
}};

}  // namespace

auto HandleSwitchArg(const std::string& arg, CliOptions& dst) -> OptResult {
  for (const auto& entry : kSwitches) {
    if (arg == entry.name) {
      entry.apply(dst);
      return OptResult::Handled;
    }
  }
  return OptResult::NotMatched;
}

}  // namespace trebuchet::driver::detail
