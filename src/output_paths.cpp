/**
 * @file output_paths.cpp
 * @brief Output naming and placement implementation
 */

#include "ffrotate/output_paths.hpp"

#include <filesystem>
#include <system_error>

#include <fmt/core.h>

#include "ffrotate/errors.hpp"
#include "ffrotate/logging.hpp"

namespace ffrotate {

namespace fs = std::filesystem;

std::string rotated_file_name(const std::string &input_path,
                              const std::string &suffix) {
  fs::path name = fs::path(input_path).filename();
  return name.stem().string() + suffix + name.extension().string();
}

std::string resolve_output_path(const std::string &input_path,
                                const std::string &output_dir,
                                const std::string &suffix) {
  return (fs::path(output_dir) / rotated_file_name(input_path, suffix))
      .string();
}

void ensure_directory(const std::string &dir) {
  std::error_code ec;
  if (fs::exists(dir, ec)) {
    if (fs::is_directory(dir, ec))
      return;
    LOG_ERROR("Output path exists and is not a directory: {}", dir);
    throw RotateError(ErrorKind::OutputDirectoryUnavailable,
                      fmt::format("'{}' is not a directory", dir));
  }

  fs::create_directories(dir, ec);
  if (ec) {
    LOG_ERROR("Failed to create output directory {}: {}", dir, ec.message());
    throw RotateError(
        ErrorKind::OutputDirectoryUnavailable,
        fmt::format("Cannot create '{}': {}", dir, ec.message()));
  }
  LOG_INFO("Created output directory: {}", dir);
}

bool move_file(const std::string &from, const std::string &to,
               std::string &error) {
  std::error_code ec;
  fs::rename(from, to, ec);
  if (!ec)
    return true;

  if (ec != std::errc::cross_device_link) {
    error = fmt::format("move '{}' -> '{}' failed: {}", from, to,
                        ec.message());
    return false;
  }

  /// Staging and destination on different filesystems
  ec.clear();
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    error = fmt::format("copy '{}' -> '{}' failed: {}", from, to,
                        ec.message());
    return false;
  }
  fs::remove(from, ec);
  if (ec) {
    LOG_WARN("Copied but could not remove staged file {}: {}", from,
             ec.message());
  }
  return true;
}

} // namespace ffrotate
