/**
 * @file ffmpeg_executor.cpp
 * @brief FFmpeg execution implementation
 */

#include "ffrotate/ffmpeg_executor.hpp"

#include <chrono>
#include <filesystem>
#include <thread>

#include <fmt/core.h>

#include "ffrotate/logging.hpp"
#include "ffrotate/process.hpp"

namespace ffrotate {

namespace fs = std::filesystem;

namespace {

/// Strip trailing newlines/spaces from FFmpeg output
std::string trim_trailing(std::string text) {
  while (!text.empty() &&
         (text.back() == '\n' || text.back() == '\r' || text.back() == ' '))
    text.pop_back();
  return text;
}

/// Last non-empty line, which is where FFmpeg puts the actual error
std::string last_line(const std::string &text) {
  size_t pos = text.find_last_of('\n');
  return pos == std::string::npos ? text : text.substr(pos + 1);
}

} // anonymous namespace

std::vector<std::string> build_rotate_command(const std::string &transcoder,
                                              const std::string &input_path,
                                              const std::string &output_path,
                                              const RotationMode &mode,
                                              const std::string &filter,
                                              const TranscodeOptions &options) {
  std::string crf =
      mode.is_custom() ? std::to_string(options.custom_crf) : std::string("0");

  return {transcoder,
          "-y",
          "-i", input_path,
          "-vf", filter,
          "-c:v", options.video_codec,
          "-crf", crf,
          "-preset", options.preset,
          output_path};
}

TranscodeOutcome execute_ffmpeg_rotate(const std::string &transcoder,
                                       const RotationRequest &request,
                                       const std::string &filter,
                                       const std::string &output_path,
                                       const TranscodeOptions &options) {
  auto start = std::chrono::high_resolution_clock::now();
  auto elapsed_us = [&start]() {
    return static_cast<long>(
        std::chrono::duration_cast<std::chrono::microseconds>(
            std::chrono::high_resolution_clock::now() - start)
            .count());
  };

  auto argv = build_rotate_command(transcoder, request.input_path, output_path,
                                   request.mode, filter, options);
  LOG_INFO("[FFmpeg] {}", format_command(argv));

  ProcessResult proc = run_process(argv);

  /// Let the filesystem settle before the output is moved or inspected
  if (options.settle_delay_ms > 0) {
    std::this_thread::sleep_for(
        std::chrono::milliseconds(options.settle_delay_ms));
  }

  std::string diagnostics = trim_trailing(proc.diagnostics);

  if (!proc.succeeded()) {
    std::string message =
        diagnostics.empty()
            ? fmt::format("FFmpeg failed with status {}", proc.exit_status)
            : diagnostics;
    LOG_ERROR("FFmpeg failed with status {}: {}", proc.exit_status,
              last_line(message));
    return TranscodeOutcome::failure(request.input_path, message,
                                     elapsed_us());
  }

  std::error_code ec;
  if (!fs::exists(output_path, ec)) {
    LOG_ERROR("FFmpeg exited cleanly but produced no output: {}",
              output_path);
    return TranscodeOutcome::failure(
        request.input_path,
        fmt::format("FFmpeg produced no output file '{}'", output_path),
        elapsed_us());
  }

  return TranscodeOutcome::success(request.input_path, output_path,
                                   elapsed_us());
}

} // namespace ffrotate
