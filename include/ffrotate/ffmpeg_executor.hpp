/**
 * @file ffmpeg_executor.hpp
 * @brief FFmpeg execution for rotate operations
 *
 * @details Builds the rotate command for one request and runs it to
 *          completion. A failing transcode is reported as a
 *          TranscodeOutcome::failure carrying FFmpeg's diagnostic output;
 *          nothing is thrown, so one bad file cannot abort a batch.
 */

#ifndef FFROTATE_FFMPEG_EXECUTOR_HPP
#define FFROTATE_FFMPEG_EXECUTOR_HPP

#include <string>
#include <vector>

#include "config.hpp"
#include "types.hpp"

namespace ffrotate {

/**
 * @struct TranscodeOptions
 * @brief Encoder and placement settings for one pipeline run.
 * @note Defaults come from the environment (see config.hpp).
 */
struct TranscodeOptions {
  std::string transcoder = Config::ffmpeg_binary(); //< Empty = PATH lookup
  std::string video_codec = Config::video_codec();
  std::string preset = Config::encode_preset();
  int custom_crf = Config::custom_crf();
  int settle_delay_ms = Config::settle_delay_ms();
  std::string output_suffix = Config::output_suffix();
  std::string staging_root = Config::staging_root(); //< Empty = system temp
};

/**
 * @brief Build the argv for a rotate run.
 *
 * @attention Fixed modes always encode at CRF 0 (lossless); custom angles
 *            use options.custom_crf, which is also 0 unless CUSTOM_CRF is set.
 *
 * @param transcoder Resolved transcoder binary
 * @param input_path Input video
 * @param output_path File FFmpeg writes
 * @param mode Rotation (selects the quality setting)
 * @param filter Resolved filter expression
 * @param options Codec and preset
 * @return argv, program first
 */
std::vector<std::string> build_rotate_command(const std::string &transcoder,
                                              const std::string &input_path,
                                              const std::string &output_path,
                                              const RotationMode &mode,
                                              const std::string &filter,
                                              const TranscodeOptions &options);

/**
 * @brief Execute FFmpeg to rotate one video.
 *
 * @param transcoder Resolved transcoder binary
 * @param request Item to rotate
 * @param filter Resolved filter expression for request.mode
 * @param output_path Where FFmpeg writes the rotated file
 * @param options Codec, preset and settle delay
 * @return success(output_path) when FFmpeg exits 0 and the file exists,
 *         failure(diagnostics) otherwise
 * @note Blocks until FFmpeg exits, then waits options.settle_delay_ms.
 */
TranscodeOutcome execute_ffmpeg_rotate(const std::string &transcoder,
                                       const RotationRequest &request,
                                       const std::string &filter,
                                       const std::string &output_path,
                                       const TranscodeOptions &options);

} // namespace ffrotate

#endif // FFROTATE_FFMPEG_EXECUTOR_HPP
