/**
 * @file staging.cpp
 * @brief Scoped filesystem resources implementation
 */

#include "ffrotate/staging.hpp"

#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>
#include <vector>

#include <stdlib.h>
#include <unistd.h>

#include <fmt/core.h>

#include "ffrotate/errors.hpp"
#include "ffrotate/logging.hpp"

namespace ffrotate {

namespace fs = std::filesystem;

namespace {

fs::path temp_root(const std::string &root) {
  if (!root.empty())
    return root;
  std::error_code ec;
  fs::path tmp = fs::temp_directory_path(ec);
  return ec ? fs::path("/tmp") : tmp;
}

} // anonymous namespace

// **---- StagingDirectory Implementation ----**

StagingDirectory::StagingDirectory(const std::string &root) {
  std::string pattern = (temp_root(root) / "ffrotate-XXXXXX").string();
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  if (!mkdtemp(buf.data())) {
    LOG_ERROR("Failed to create staging directory under {}: {}",
              temp_root(root).string(), std::strerror(errno));
    throw RotateError(ErrorKind::StagingUnavailable,
                      fmt::format("Cannot create staging directory in '{}'",
                                  temp_root(root).string()));
  }
  path_ = buf.data();
}

StagingDirectory::~StagingDirectory() { remove(); }

StagingDirectory::StagingDirectory(StagingDirectory &&other) noexcept
    : path_(std::move(other.path_)) {
  other.path_.clear();
}

StagingDirectory &
StagingDirectory::operator=(StagingDirectory &&other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

void StagingDirectory::remove() {
  if (path_.empty())
    return;
  std::error_code ec;
  fs::remove_all(path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove staging directory {}: {}", path_,
             ec.message());
  }
  path_.clear();
}

// **---- ScopedFile Implementation ----**

ScopedFile::~ScopedFile() { remove(); }

ScopedFile::ScopedFile(ScopedFile &&other) noexcept
    : path_(std::move(other.path_)) {
  other.path_.clear();
}

ScopedFile &ScopedFile::operator=(ScopedFile &&other) noexcept {
  if (this != &other) {
    remove();
    path_ = std::move(other.path_);
    other.path_.clear();
  }
  return *this;
}

std::string ScopedFile::release() {
  std::string p = std::move(path_);
  path_.clear();
  return p;
}

void ScopedFile::remove() {
  if (path_.empty())
    return;
  std::error_code ec;
  fs::remove(path_, ec);
  if (ec) {
    LOG_WARN("Failed to remove temp file {}: {}", path_, ec.message());
  }
  path_.clear();
}

std::string make_temp_file(const std::string &suffix) {
  std::string pattern = (temp_root("") / "ffrotate-XXXXXX").string() + suffix;
  std::vector<char> buf(pattern.begin(), pattern.end());
  buf.push_back('\0');

  int fd = mkstemps(buf.data(), static_cast<int>(suffix.size()));
  if (fd == -1) {
    LOG_ERROR("Failed to create temp file: {}", std::strerror(errno));
    return {};
  }
  close(fd);
  return buf.data();
}

} // namespace ffrotate
