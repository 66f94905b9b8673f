/**
 * @file system.hpp
 * @brief Host environment utilities
 *
 * @details Provides:
 *
 *          - Executable lookup on the PATH search path
 *
 *          - Transcoder binary resolution (explicit location or PATH)
 *
 *          - Time formatting utilities
 */

#ifndef FFROTATE_SYSTEM_HPP
#define FFROTATE_SYSTEM_HPP

#include <string>

namespace ffrotate {

// **---- Executable Lookup ----**

/**
 * @brief Find an executable the way a shell would.
 *
 * @note Names containing a '/' are checked directly; anything else is
 *       searched for in each PATH entry.
 *
 * @param name Program name or path
 * @return Absolute path of the executable, or an empty string
 */
std::string find_executable(const std::string &name);

/**
 * @brief Resolve the transcoder binary.
 *
 * @param explicit_path Declared location (bundled binary). Empty = search
 *                      PATH for "ffmpeg".
 * @return Path of an executable transcoder
 * @throws RotateError (TranscoderNotFound) when nothing executable is found
 */
std::string locate_transcoder(const std::string &explicit_path);

// **---- Utilities ----**

/**
 * @brief Format seconds as HH:MM:SS string.
 * @param seconds Time in seconds
 * @return Formatted string in HH:MM:SS format
 */
std::string format_time(double seconds);

} // namespace ffrotate

#endif // FFROTATE_SYSTEM_HPP
