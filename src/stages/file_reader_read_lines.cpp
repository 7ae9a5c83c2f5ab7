/***
 * Name: trebuchet::stages::FileReader::ReadLines
 * Purpose: Read a file from disk and split it, recording ReadFile and SplitLines phases.
 * Inputs:
 *   - path: file path
 * Outputs:
 *   - std::vector<std::string>: the file's lines
 * Theory of Operation: Uses support::ReadFile; a failed read is rethrown as
 *   FileReadError with the support layer's message. Counts lines for metrics.
 */
#include "trebuchet/stages/file_reader.h"

#include <string>
#include <vector>

#include "trebuchet/exceptions/file_read_error.h"
#include "trebuchet/metrics/metrics.h"  // direct use of Metrics::ScopedTimer
#include "trebuchet/support/fs.h"
#include "trebuchet/support/lines.h"

namespace trebuchet::stages {

auto FileReader::ReadLines(const std::string& path) -> std::vector<std::string> {
  std::string text;
  std::string err;
  {
    const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::ReadFile);
    if (!support::ReadFile(path, text, err)) {
      throw exceptions::FileReadError(err);
    }
  }
  const metrics::Metrics::ScopedTimer timer(metrics::Metrics::Phase::SplitLines);
  auto lines = support::SplitLines(text);
  CountLines(lines.size());
  return lines;
}

}  // namespace trebuchet::stages
