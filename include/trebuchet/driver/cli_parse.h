/***
 * Name: trebuchet::driver (cli_parse helpers)
 * Purpose: Option handlers behind ParseCli, one per option shape: bare switch,
 *   flag with a fixed value set, directory argument, input file.
 * Inputs: Argument string(s), index into args, CLI options destination, error stream
 * Outputs: detail::OptResult (NotMatched, Handled, Error)
 * Theory of Operation: RunHandlers tries them in order for each argument; the
 *   input handler comes last and accepts whatever the others left.
 */
#pragma once

#include <ostream>
#include <string>
#include <vector>

#include "trebuchet/driver/cli.h"

namespace trebuchet {
namespace driver {
namespace detail {

/*** HandleSwitchArg: Bare switches (-h, --help, --metrics). */
OptResult HandleSwitchArg(const std::string& arg, CliOptions& dst);

/***
 * HandleChoiceArg: "--flag=value" options with a fixed value set
 * (--part, --strategy, --metrics). A known flag with a missing or unknown
 * value is an error that lists the accepted values.
 */
OptResult HandleChoiceArg(const std::string& arg, CliOptions& dst, std::ostream& err);

/*** HandleLogPathArg: Handle --log-path=<dir> and --log-path <dir>. */
OptResult HandleLogPathArg(const std::vector<std::string>& args,
                           int& index,
                           int argc,
                           CliOptions& dst,
                           std::ostream& err);

/***
 * HandleInputArg: Record the input file. After "--" every remaining token is
 * an input; otherwise a leading '-' is an unknown option. A second input is
 * rejected on the spot.
 */
OptResult HandleInputArg(const std::vector<std::string>& args,
                         int& index,
                         int argc,
                         CliOptions& dst,
                         std::ostream& err);

/*** RunHandlers: Execute ordered handlers for current arg index. */
OptResult RunHandlers(const std::vector<std::string>& args,
                      int& index,
                      int argc,
                      CliOptions& dst,
                      std::ostream& err);

}  // namespace detail
}  // namespace driver
}  // namespace trebuchet
