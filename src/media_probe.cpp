/**
 * @file media_probe.cpp
 * @brief Duration probing and preview frame implementation
 */

#include "ffrotate/media_probe.hpp"

#include <filesystem>
#include <stdexcept>

#include <fmt/core.h>

#include "ffrotate/errors.hpp"
#include "ffrotate/filter_resolver.hpp"
#include "ffrotate/logging.hpp"
#include "ffrotate/process.hpp"
#include "ffrotate/staging.hpp"
#include "ffrotate/system.hpp"

namespace ffrotate {

namespace fs = std::filesystem;

std::optional<double> parse_duration(const std::string &diagnostics) {
  static const std::string marker = "Duration: ";

  size_t pos = diagnostics.find(marker);
  if (pos == std::string::npos)
    return std::nullopt;
  pos += marker.size();

  /// Value runs up to the next comma or end of line
  size_t end = diagnostics.find_first_of(",\r\n", pos);
  std::string value = diagnostics.substr(
      pos, end == std::string::npos ? std::string::npos : end - pos);

  size_t c1 = value.find(':');
  size_t c2 = (c1 == std::string::npos) ? c1 : value.find(':', c1 + 1);
  if (c2 == std::string::npos)
    return std::nullopt;

  try {
    double h = std::stod(value.substr(0, c1));
    double m = std::stod(value.substr(c1 + 1, c2 - c1 - 1));
    double s = std::stod(value.substr(c2 + 1));
    if (h < 0 || m < 0 || s < 0)
      return std::nullopt;
    return h * 3600 + m * 60 + s;
  } catch (const std::invalid_argument &) {
    return std::nullopt;
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

ProbeResult probe_duration(const std::string &transcoder,
                           const std::string &input_path) {
  TIMER_START(probe_duration);
  ProcessResult proc =
      run_process({transcoder, "-i", input_path, "-f", "null", "-"});
  TIMER_END(probe_duration);

  auto duration = parse_duration(proc.diagnostics);
  if (!duration) {
    LOG_ERROR("Could not determine duration of {}", input_path);
    throw RotateError(
        ErrorKind::DurationUnavailable,
        fmt::format("Could not determine video duration of '{}'", input_path));
  }

  LOG_INFO("Duration: {} ({:.2f}s)", format_time(*duration), *duration);
  return ProbeResult{*duration};
}

std::string extract_preview_frame(const std::string &transcoder,
                                  const std::string &input_path,
                                  const RotationMode &mode) {
  std::string filter = resolve_filter(mode);
  ProbeResult probe = probe_duration(transcoder, input_path);
  double seek_time = probe.duration_seconds / 2;

  std::string tmp = make_temp_file(".png");
  if (tmp.empty()) {
    throw RotateError(ErrorKind::FrameExtractionFailed,
                      "Cannot create temporary preview file");
  }
  ScopedFile frame(tmp);

  LOG_PHASE("Extracting preview at {} ({})", format_time(seek_time),
            describe(mode));

  TIMER_START(extract_frame);
  ProcessResult proc = run_process({transcoder, "-y", "-ss",
                                    fmt::format("{:.3f}", seek_time), "-i",
                                    input_path, "-vf", filter, "-vframes", "1",
                                    frame.path()});
  TIMER_END(extract_frame);

  std::error_code ec;
  if (!proc.succeeded() || fs::file_size(frame.path(), ec) == 0 || ec) {
    LOG_ERROR("Preview extraction failed for {} (status {})", input_path,
              proc.exit_status);
    throw RotateError(ErrorKind::FrameExtractionFailed,
                      proc.diagnostics.empty()
                          ? fmt::format("FFmpeg failed with status {}",
                                        proc.exit_status)
                          : proc.diagnostics);
  }

  return frame.release();
}

} // namespace ffrotate
