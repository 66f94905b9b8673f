/**
 * @file main.cpp
 * @brief Entry point for the ffrotate command-line tool
 *
 * @details Commands:
 *
 *          - rotate: batch rotation of files and/or directories
 *
 *          - preview: one rotated frame from the middle of a video
 */

#include <cstdio>
#include <string>
#include <vector>

#include "ffrotate/cli.hpp"
#include "ffrotate/logging.hpp"

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  std::vector<std::string> args(argv + 1, argv + argc);
  int ret = ffrotate::run_cli(args);

  ffrotate::TimingCollector::print_summary();
  return ret;
}
