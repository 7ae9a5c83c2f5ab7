/***
 * Name: trebuchet::driver::WriteLineLog
 * Purpose: Persist the per-line log under a timestamped name.
 * Inputs:
 *   - log_dir: destination directory (created when missing)
 *   - rows: per-line values
 *   - err: warning stream
 * Outputs:
 *   - bool: true when the log was written
 * Theory of Operation: std::filesystem for the directory, localtime for the
 *   "%Y%m%d-%H%M%S-" prefix and an ofstream for the FormatLineLog text.
 */
#include "trebuchet/driver/app.h"

#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>
#include <iomanip>
#include <ios>
#include <ostream>
#include <sstream>
#include <string>
#include <system_error>
#include <vector>

namespace trebuchet::driver {

static std::string TimestampPrefix() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm_buf{};
  localtime_r(&now_time, &tm_buf);
  std::ostringstream stamp;
  stamp << std::put_time(&tm_buf, "%Y%m%d-%H%M%S") << '-';
  return stamp.str();
}

auto WriteLineLog(const std::string& log_dir, const std::vector<LineLogRow>& rows, std::ostream& err) -> bool {
  namespace fs = std::filesystem;
  std::error_code err_code;
  if (!fs::exists(log_dir, err_code)) {
    if (!fs::create_directories(log_dir, err_code) && !fs::exists(log_dir, err_code)) {
      err << "trebuchet: warning: failed to create log directory '" << log_dir << "': "
          << err_code.message() << '\n';
      return false;
    }
  }
  const std::string path = (fs::path(log_dir) / (TimestampPrefix() + "calibration.lines.log")).string();
  std::ofstream log_stream(path, std::ios::binary);
  if (!log_stream.is_open()) {
    err << "trebuchet: warning: failed to open line log '" << path << "'" << '\n';
    return false;
  }
  log_stream << FormatLineLog(rows);
  log_stream.flush();
  if (!log_stream.good()) {
    err << "trebuchet: warning: failed to write line log '" << path << "'" << '\n';
    return false;
  }
  return true;
}

}  // namespace trebuchet::driver
