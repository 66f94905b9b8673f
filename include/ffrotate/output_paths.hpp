/**
 * @file output_paths.hpp
 * @brief Output naming and placement
 *
 * @details Rotated files keep their stem and extension with a fixed suffix
 *          inserted in between: clip.mp4 -> clip_rotated.mp4.
 *
 * @attention There is no collision protection. Two inputs that derive the
 *            same name in one run overwrite each other (last writer wins).
 */

#ifndef FFROTATE_OUTPUT_PATHS_HPP
#define FFROTATE_OUTPUT_PATHS_HPP

#include <string>

#include "config.hpp"

namespace ffrotate {

/**
 * @brief Derive the rotated file name from an input path.
 * @param input_path Input file (only the file name is used)
 * @param suffix Text inserted before the extension
 * @return File name without directory, e.g. "clip_rotated.mp4"
 */
std::string rotated_file_name(const std::string &input_path,
                              const std::string &suffix = Config::output_suffix());

/**
 * @brief Full destination path of a rotated file.
 * @note Pure path arithmetic; calling it twice yields the same path.
 */
std::string resolve_output_path(const std::string &input_path,
                                const std::string &output_dir,
                                const std::string &suffix = Config::output_suffix());

/**
 * @brief Make sure a directory exists, creating missing segments.
 * @throws RotateError (OutputDirectoryUnavailable) if it cannot be created
 *         or a non-directory is in the way
 */
void ensure_directory(const std::string &dir);

/**
 * @brief Move a file, replacing any existing destination.
 *
 * @note Falls back to copy + remove when source and destination are on
 *       different filesystems.
 *
 * @param from Source file
 * @param to Destination file
 * @param error Output: reason on failure
 * @return true on success
 */
bool move_file(const std::string &from, const std::string &to,
               std::string &error);

} // namespace ffrotate

#endif // FFROTATE_OUTPUT_PATHS_HPP
