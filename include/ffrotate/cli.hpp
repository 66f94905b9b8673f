/**
 * @file cli.hpp
 * @brief Command-line front-end used by main()
 */

#ifndef FFROTATE_CLI_HPP
#define FFROTATE_CLI_HPP

#include <filesystem>
#include <string>
#include <vector>

namespace ffrotate {

/// True for .mp4 .mov .avi .mkv .ts, any case
bool is_video_file(const std::filesystem::path &path);

/**
 * @brief Expand directories into the video files they contain.
 * @note Directory contents are sorted; other arguments pass through
 *       unchanged so missing files surface as per-item failures. A listing
 *       error is logged and keeps whatever was read.
 */
std::vector<std::string> expand_inputs(const std::vector<std::string> &args);

/**
 * @brief Run one command line (without the program name).
 * @return Exit status: 0, the capped failure count, or 1 on a usage or
 *         job-level error. Never throws.
 */
int run_cli(const std::vector<std::string> &argv);

} // namespace ffrotate

#endif // FFROTATE_CLI_HPP
