/**
 * @file system.cpp
 * @brief Host environment utilities implementation
 *
 * @details Provides:
 *
 *          - PATH search for executables
 *
 *          - Transcoder resolution with job-level failure
 *
 *          - Time formatting utilities
 */

#include "ffrotate/system.hpp"

#include <cstdlib>
#include <filesystem>
#include <string>

#include <unistd.h>

#include <fmt/core.h>

#include "ffrotate/errors.hpp"
#include "ffrotate/logging.hpp"

namespace ffrotate {

namespace fs = std::filesystem;

// **---- Internal Helpers ----**

namespace {

/// Regular file with the execute bit for this process
bool is_executable_file(const fs::path &path) {
  std::error_code ec;
  if (!fs::is_regular_file(path, ec))
    return false;
  return access(path.c_str(), X_OK) == 0;
}

} // anonymous namespace

// **---- Executable Lookup ----**

std::string find_executable(const std::string &name) {
  if (name.empty())
    return {};

  if (name.find('/') != std::string::npos) {
    return is_executable_file(name) ? fs::absolute(name).string()
                                    : std::string();
  }

  const char *path_env = std::getenv("PATH");
  if (!path_env)
    return {};

  std::string search_path = path_env;
  size_t pos = 0;
  while (pos <= search_path.size()) {
    size_t end = search_path.find(':', pos);
    if (end == std::string::npos)
      end = search_path.size();

    /// An empty PATH entry means the current directory
    std::string dir = search_path.substr(pos, end - pos);
    if (dir.empty())
      dir = ".";

    fs::path candidate = fs::path(dir) / name;
    if (is_executable_file(candidate))
      return fs::absolute(candidate).string();

    pos = end + 1;
  }
  return {};
}

std::string locate_transcoder(const std::string &explicit_path) {
  if (!explicit_path.empty()) {
    std::string found = find_executable(explicit_path);
    if (found.empty()) {
      LOG_ERROR("Transcoder not executable at declared location: {}",
                explicit_path);
      throw RotateError(
          ErrorKind::TranscoderNotFound,
          fmt::format("FFmpeg not found at '{}'", explicit_path));
    }
    return found;
  }

  std::string found = find_executable("ffmpeg");
  if (found.empty()) {
    LOG_ERROR("FFmpeg not found on PATH");
    throw RotateError(ErrorKind::TranscoderNotFound,
                      "FFmpeg not found. Install it and add it to PATH, or "
                      "set FFMPEG_BINARY");
  }
  return found;
}

// **---- Utilities ----**

std::string format_time(double seconds) {
  int h = static_cast<int>(seconds) / 3600;
  int m = (static_cast<int>(seconds) % 3600) / 60;
  int s = static_cast<int>(seconds) % 60;
  return fmt::format("{:02d}:{:02d}:{:02d}", h, m, s);
}

} // namespace ffrotate
