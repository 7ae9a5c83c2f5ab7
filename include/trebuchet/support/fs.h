/***
 * Name: trebuchet::support (fs)
 * Purpose: Load an input file for the FileReader stage.
 * Inputs: Path and string buffers
 * Outputs: File contents, or an error message naming the path
 */
#pragma once

#include <string>

namespace trebuchet {
namespace support {

/***
 * ReadFile: Read the whole file at path into out. Returns false with err set
 * to "input is a directory: <path>", "failed to open file: <path>" or
 * "failed to read file: <path>".
 */
bool ReadFile(const std::string& path, std::string& out, std::string& err);

}  // namespace support
}  // namespace trebuchet
