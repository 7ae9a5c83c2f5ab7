/***
 * Name: trebuchet::driver::detail::HandleChoiceArg
 * Purpose: Parse --part=1|2, --strategy=rewrite|scan and --metrics=text|json.
 * Inputs:
 *   - arg: current argument string
 *   - dst: CLI options destination
 *   - err: error stream
 * Outputs: OptResult indicating match and success/failure
 * Theory of Operation: Splits the argument at the first '=' and looks the
 *   (flag, value) pair up in kChoices. A flag that is in the table but has no
 *   matching value reports "unknown <noun> '<value>'" with the accepted values
 *   joined from the same table, so usage and validation cannot drift apart.
 */
#include "trebuchet/driver/cli_parse.h"
#include "trebuchet/driver/cli.h"  // direct use of CliOptions

#include <array>
#include <cstddef>
#include <ostream>
#include <string>
#include <string_view>

namespace trebuchet::driver::detail {

namespace {

struct Choice {
  std::string_view flag;
  std::string_view noun;
  std::string_view value;
  void (*apply)(CliOptions&);
};

constexpr std::array<Choice, 6> kChoices{{
    {"--part", "part", "1", [](CliOptions& o) { o.parts = CliOptions::Parts::One; }},
    {"--part", "part", "2", [](CliOptions& o) { o.parts = CliOptions::Parts::Two; }},
    {"--strategy", "strategy", "rewrite", [](CliOptions& o) { o.strategy = stages::Strategy::Rewrite; }},
    {"--strategy", "strategy", "scan", [](CliOptions& o) { o.strategy = stages::Strategy::Scan; }},
    {"--metrics", "metrics format", "text",
     [](CliOptions& o) {
       o.metrics = true;
       o.metrics_format = CliOptions::MetricsFormat::Text;
     }},
    {"--metrics", "metrics format", "json",
     [](CliOptions& o) {
       o.metrics = true;
       o.metrics_format = CliOptions::MetricsFormat::Json;
     }},
}};

std::string AcceptedValues(std::string_view flag) {
  std::string joined;
  for (const auto& choice : kChoices) {
    if (choice.flag != flag) {
      continue;
    }
    if (!joined.empty()) {
      joined += " or ";
    }
    joined += choice.value;
  }
  return joined;
}

}  // namespace

auto HandleChoiceArg(const std::string& arg, CliOptions& dst, std::ostream& err) -> OptResult {
  const std::string_view view(arg);
  const std::size_t eq_pos = view.find('=');
  const std::string_view flag = view.substr(0, eq_pos);
  const Choice* known = nullptr;
  for (const auto& choice : kChoices) {
    if (choice.flag != flag) {
      continue;
    }
    known = &choice;
    if (eq_pos != std::string_view::npos && choice.value == view.substr(eq_pos + 1)) {
      choice.apply(dst);
      return OptResult::Handled;
    }
  }
  if (known == nullptr) {
    return OptResult::NotMatched;
  }
  if (eq_pos == std::string_view::npos) {
    err << "trebuchet: error: missing value for '" << flag << "' (expected " << AcceptedValues(flag) << ")"
        << '\n';
  } else {
    err << "trebuchet: error: unknown " << known->noun << " '" << view.substr(eq_pos + 1) << "' (expected "
        << AcceptedValues(flag) << ")" << '\n';
  }
  return OptResult::Error;
}

}  // namespace trebuchet::driver::detail
