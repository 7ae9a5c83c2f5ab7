/***
 * Name: trebuchet::stages::FileReader
 * Purpose: Stage class for reading an input file as a list of lines.
 * Inputs: Filesystem path
 * Outputs: Lines of the file
 * Theory of Operation: Wraps support::ReadFile and support::SplitLines and
 *   instruments metrics via RAII. Read failures raise FileReadError.
 */
#pragma once

#include <string>
#include <vector>

#include "trebuchet/metrics/metrics.h"

namespace trebuchet {
namespace stages {

class FileReader : public metrics::Metrics {
 public:
  /*** ReadLines: Read file at path and split it into lines. */
  static std::vector<std::string> ReadLines(const std::string& path);
};

}  // namespace stages
}  // namespace trebuchet
