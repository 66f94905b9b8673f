/**
 * @file media_probe.hpp
 * @brief Duration probing and rotated preview frames
 *
 * @details Both operations run the transcoder directly and are independent
 *          of any batch:
 *
 *          - probe_duration: "ffmpeg -i <in> -f null -" and parse the
 *            "Duration: HH:MM:SS.ff" marker from its diagnostic stream
 *
 *          - extract_preview_frame: one rotated frame from the temporal
 *            midpoint, written to a fresh temporary PNG
 */

#ifndef FFROTATE_MEDIA_PROBE_HPP
#define FFROTATE_MEDIA_PROBE_HPP

#include <optional>
#include <string>

#include "types.hpp"

namespace ffrotate {

/**
 * @brief Parse the first "Duration: HH:MM:SS.ff" marker.
 * @param diagnostics Transcoder stderr
 * @return Seconds (h*3600 + m*60 + s), or std::nullopt if absent or "N/A"
 */
std::optional<double> parse_duration(const std::string &diagnostics);

/**
 * @brief Ask the transcoder for the duration of a media file.
 * @throws RotateError (DurationUnavailable) when no duration is reported
 */
ProbeResult probe_duration(const std::string &transcoder,
                           const std::string &input_path);

/**
 * @brief Extract one rotated frame at duration / 2.
 *
 * @attention The caller owns the returned file and must delete it on every
 *            exit path (wrap it in a ScopedFile).
 *
 * @param transcoder Resolved transcoder binary
 * @param input_path Input video
 * @param mode Rotation to preview
 * @return Path of the temporary PNG
 * @throws RotateError (InvalidAngle, DurationUnavailable,
 *         FrameExtractionFailed)
 */
std::string extract_preview_frame(const std::string &transcoder,
                                  const std::string &input_path,
                                  const RotationMode &mode);

} // namespace ffrotate

#endif // FFROTATE_MEDIA_PROBE_HPP
