/**
 * @file staging.hpp
 * @brief Scoped filesystem resources
 *
 * @details Provides:
 *          - StagingDirectory: per-batch scratch directory, removed on
 *            destruction
 *
 *          - ScopedFile: a single file removed on destruction unless
 *            released (preview frames)
 *
 *          - make_temp_file: create a fresh, uniquely named temp file
 */

#ifndef FFROTATE_STAGING_HPP
#define FFROTATE_STAGING_HPP

#include <string>
#include <utility>

namespace ffrotate {

/**
 * @class StagingDirectory
 * @brief RAII owner of a uniquely named scratch directory.
 * @note Everything inside is deleted on destruction, on success and error
 *       paths alike. Supports move semantics but not copy.
 */
class StagingDirectory {
public:
  /**
   * @brief Create "<root>/ffrotate-XXXXXX".
   * @param root Parent directory (empty = system temp directory)
   * @throws RotateError (StagingUnavailable)
   */
  explicit StagingDirectory(const std::string &root = "");
  ~StagingDirectory();

  /// Disable copy
  StagingDirectory(const StagingDirectory &) = delete;
  StagingDirectory &operator=(const StagingDirectory &) = delete;

  /// Enable move
  StagingDirectory(StagingDirectory &&other) noexcept;
  StagingDirectory &operator=(StagingDirectory &&other) noexcept;

  const std::string &path() const { return path_; }

private:
  void remove();

  std::string path_;
};

/**
 * @class ScopedFile
 * @brief Deletes a file when it goes out of scope.
 */
class ScopedFile {
public:
  ScopedFile() = default;
  explicit ScopedFile(std::string path) : path_(std::move(path)) {}
  ~ScopedFile();

  /// Disable copy
  ScopedFile(const ScopedFile &) = delete;
  ScopedFile &operator=(const ScopedFile &) = delete;

  /// Enable move
  ScopedFile(ScopedFile &&other) noexcept;
  ScopedFile &operator=(ScopedFile &&other) noexcept;

  const std::string &path() const { return path_; }

  /// Give up ownership; the file is kept
  std::string release();

private:
  void remove();

  std::string path_;
};

/**
 * @brief Create an empty temp file with a unique name.
 * @param suffix File name suffix, e.g. ".png"
 * @return Path of the created file, or an empty string on failure
 */
std::string make_temp_file(const std::string &suffix);

} // namespace ffrotate

#endif // FFROTATE_STAGING_HPP
