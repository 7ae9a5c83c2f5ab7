/***
 * Name: trebuchet::support::ReadFile
 * Purpose: Read an input file into a string for line splitting.
 * Inputs:
 *   - path: filesystem path to read
 * Outputs:
 *   - out: file contents on success (bytes as-is; CR stripping happens in SplitLines)
 *   - err: error message on failure
 * Theory of Operation: A directory opens fine as an ifstream on Linux and only
 *   fails on the first read, so it is rejected up front with its own message.
 */
#include "trebuchet/support/fs.h"

#include <filesystem>
#include <fstream>
#include <ios>
#include <iterator>
#include <string>
#include <system_error>

namespace trebuchet::support {

auto ReadFile(const std::string& path, std::string& out, std::string& err) -> bool {
  std::error_code err_code;
  if (std::filesystem::is_directory(path, err_code)) {
    err = "input is a directory: " + path;
    return false;
  }
  std::ifstream file_stream(path, std::ios::binary);
  if (!file_stream.is_open()) {
    err = "failed to open file: " + path;
    return false;
  }
  out.assign(std::istreambuf_iterator<char>(file_stream), std::istreambuf_iterator<char>());
  if (file_stream.bad()) {
    err = "failed to read file: " + path;
    return false;
  }
  return true;
}

}  // namespace trebuchet::support
