/***
 * Name: trebuchet::tests::RunCalibration
 * Purpose: Exercise the driver pipeline in-process: totals, part selection,
 *   diagnostics, per-line logs and metrics reporting.
 * Inputs: Temporary input files
 * Outputs: Pass/fail test results.
 */
#include <gtest/gtest.h>

#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "trebuchet/driver/app.h"
#include "trebuchet/driver/cli.h"
#include "trebuchet/metrics/metrics.h"

namespace fs = std::filesystem;
using namespace trebuchet::driver;
using trebuchet::metrics::Metrics;

static std::string WriteInput(const std::string& name, const std::string& text) {
  const fs::path dir = fs::temp_directory_path() / "trebuchet_driver_tests";
  fs::create_directories(dir);
  const std::string path = (dir / name).string();
  std::ofstream out(path, std::ios::binary);
  out << text;
  return path;
}

static const char* kWordInput =
    "two1nine\neightwothree\nabcone2threexyz\nxtwone3four\n4nineeightseven2\nzoneight234\n7pqrstsixteen\n";

TEST(RunCalibration, PrintsBothParts) {
  const auto path = WriteInput("both.txt", "1abc2\npqr3stu8vwx\na1b2c3d4e5f\ntreb7uchet\n");
  std::ostringstream out;
  std::ostringstream err;
  EXPECT_EQ(0, RunCalibration(CliOptions{}, path, out, err)) << err.str();
  EXPECT_EQ("Part 1:\t142\nPart 2:\t142\n", out.str());
  EXPECT_TRUE(err.str().empty());
}

TEST(RunCalibration, PartTwoOnlyWithScanStrategy) {
  const auto path = WriteInput("words.txt", kWordInput);
  CliOptions opts;
  opts.parts = CliOptions::Parts::Two;
  opts.strategy = trebuchet::stages::Strategy::Scan;
  std::ostringstream out;
  std::ostringstream err;
  EXPECT_EQ(0, RunCalibration(opts, path, out, err)) << err.str();
  EXPECT_EQ("Part 2:\t281\n", out.str());
}

TEST(RunCalibration, DigitlessLineFailsWithoutPartialOutput) {
  // Line 2 has words only: Part 1 fails before anything is printed.
  const auto path = WriteInput("wordsonly.txt", "1abc2\nsevenine\n");
  std::ostringstream out;
  std::ostringstream err;
  EXPECT_EQ(2, RunCalibration(CliOptions{}, path, out, err));
  EXPECT_TRUE(out.str().empty());
  EXPECT_NE(std::string::npos, err.str().find(path + ":2:1: error: no numeral found in line"));
  EXPECT_NE(std::string::npos, err.str().find("  sevenine\n  ^\n"));
}

TEST(RunCalibration, PartTwoFailureNamesWords) {
  const auto path = WriteInput("nothing.txt", "one\nxyz\n");
  CliOptions opts;
  opts.parts = CliOptions::Parts::Two;
  std::ostringstream out;
  std::ostringstream err;
  EXPECT_EQ(2, RunCalibration(opts, path, out, err));
  EXPECT_NE(std::string::npos, err.str().find(":2:1: error: no numeral or digit word found in line"));
}

TEST(RunCalibration, MissingFileReported) {
  std::ostringstream out;
  std::ostringstream err;
  EXPECT_EQ(2, RunCalibration(CliOptions{}, "/nonexistent/trebuchet.txt", out, err));
  EXPECT_NE(std::string::npos, err.str().find("trebuchet: failed to open file: /nonexistent/trebuchet.txt"));
}

TEST(RunCalibration, WritesPerLineLog) {
  const auto path = WriteInput("logged.txt", "two1nine\ntreb7uchet\n");
  const fs::path log_dir = fs::temp_directory_path() / "trebuchet_driver_tests" / "logs";
  fs::remove_all(log_dir);
  CliOptions opts;
  opts.log_path = log_dir.string();
  std::ostringstream out;
  std::ostringstream err;
  ASSERT_EQ(0, RunCalibration(opts, path, out, err)) << err.str();

  std::string log_text;
  int log_files = 0;
  for (const auto& entry : fs::directory_iterator(log_dir)) {
    if (entry.path().filename().string().find("calibration.lines.log") != std::string::npos) {
      ++log_files;
      std::ifstream in(entry.path());
      std::stringstream buf;
      buf << in.rdbuf();
      log_text = buf.str();
    }
  }
  EXPECT_EQ(1, log_files);
  EXPECT_EQ("line 1: part1=11 part2=29\nline 2: part1=77 part2=77\n", log_text);
}

TEST(RunCalibration, LineLogFailureIsOnlyAWarning) {
  const auto blocker = WriteInput("not_a_dir.txt", "x");
  const std::string log_dir = (fs::path(blocker) / "logs").string();
  std::ostringstream err;
  EXPECT_FALSE(WriteLineLog(log_dir, {}, err));
  EXPECT_NE(std::string::npos, err.str().find("trebuchet: warning: failed to create log directory"));

  const auto path = WriteInput("still_ok.txt", "1abc2\n");
  CliOptions opts;
  opts.log_path = log_dir;
  std::ostringstream out;
  std::ostringstream run_err;
  EXPECT_EQ(0, RunCalibration(opts, path, out, run_err));
  EXPECT_EQ("Part 1:\t12\nPart 2:\t12\n", out.str());
  EXPECT_NE(std::string::npos, run_err.str().find("warning"));
}

TEST(RunCalibration, DirectoryInputReported) {
  const fs::path dir = fs::temp_directory_path() / "trebuchet_driver_tests";
  fs::create_directories(dir);
  std::ostringstream out;
  std::ostringstream err;
  EXPECT_EQ(2, RunCalibration(CliOptions{}, dir.string(), out, err));
  EXPECT_TRUE(out.str().empty());
  EXPECT_NE(std::string::npos, err.str().find("trebuchet: input is a directory: " + dir.string()));
}

TEST(RunCalibration, FormatLineLogOmitsMissingParts) {
  std::vector<LineLogRow> rows(2);
  rows[0].line_number = 1;
  rows[0].part2 = 21;
  rows[1].line_number = 2;
  rows[1].part2 = 83;
  EXPECT_EQ("line 1: part2=21\nline 2: part2=83\n", FormatLineLog(rows));
}

// Every line carries a numeral, so both parts succeed.
static const char* kMixedInput = "two1nine\nxtwone3four\n4nineeightseven2\n7pqrstsixteen\n";

TEST(RunCalibration, MetricsTextAndJson) {
  const auto path = WriteInput("metrics.txt", kMixedInput);
  CliOptions opts;
  opts.metrics = true;
  Metrics::Reset();
  Metrics::Enable(true);
  std::ostringstream out;
  std::ostringstream err;
  ASSERT_EQ(0, RunCalibration(opts, path, out, err)) << err.str();
  EXPECT_EQ("Part 1:\t163\nPart 2:\t171\n", out.str());

  std::ostringstream text;
  ReportMetricsIfRequested(opts, text);
  EXPECT_NE(std::string::npos, text.str().find("== Metrics =="));
  EXPECT_NE(std::string::npos, text.str().find("ReadFile"));
  EXPECT_NE(std::string::npos, text.str().find("Words"));
  EXPECT_NE(std::string::npos, text.str().find("Lines: 4"));
  EXPECT_NE(std::string::npos, text.str().find("Word tokens: 9"));

  opts.metrics_format = CliOptions::MetricsFormat::Json;
  std::ostringstream json;
  ReportMetricsIfRequested(opts, json);
  EXPECT_NE(std::string::npos, json.str().find("\"durations_ns\""));
  EXPECT_NE(std::string::npos, json.str().find("\"phase\": \"Digits\""));
  EXPECT_NE(std::string::npos, json.str().find("\"lines\": 4"));

  Metrics::Reset();
}

TEST(RunCalibration, MetricsSilentWhenNotRequested) {
  std::ostringstream out;
  ReportMetricsIfRequested(CliOptions{}, out);
  EXPECT_TRUE(out.str().empty());
}
