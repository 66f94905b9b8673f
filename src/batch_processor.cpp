/**
 * @file batch_processor.cpp
 * @brief Sequential batch rotation implementation
 *
 * @details Implements the BatchProcessor class:
 *
 *          - Up-front job validation
 *
 *          - Per-item staging and transcoding
 *
 *          - Final placement with last-writer-wins on name collisions
 *
 *          - Summary output
 */

#include "ffrotate/batch_processor.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <filesystem>
#include <map>
#include <utility>

#include <fmt/color.h>
#include <fmt/core.h>

#include "ffrotate/errors.hpp"
#include "ffrotate/filter_resolver.hpp"
#include "ffrotate/logging.hpp"
#include "ffrotate/output_paths.hpp"
#include "ffrotate/staging.hpp"
#include "ffrotate/system.hpp"

namespace ffrotate {

namespace fs = std::filesystem;

BatchProcessor::BatchProcessor(TranscodeOptions options)
    : options_(std::move(options)) {}

void BatchProcessor::validate(const std::vector<std::string> &input_files,
                              const RotationMode &mode,
                              const std::string &output_dir) {
  if (input_files.empty()) {
    LOG_ERROR("No input files to process");
    throw RotateError(ErrorKind::EmptyBatch, "No input files to process");
  }
  if (mode.is_custom() && !mode.angle) {
    LOG_ERROR("Custom rotation selected without an angle");
    throw RotateError(ErrorKind::MissingAngle,
                      "Please provide a custom angle");
  }
  if (output_dir.empty()) {
    LOG_ERROR("No output directory specified");
    throw RotateError(ErrorKind::NoOutputDirectory,
                      "No output directory specified");
  }
  if (mode.is_custom() && !std::isfinite(*mode.angle)) {
    LOG_ERROR("Custom angle is not a finite number");
    throw RotateError(ErrorKind::InvalidAngle,
                      fmt::format("Invalid custom angle {}", *mode.angle));
  }
}

void BatchProcessor::advance(BatchJob &job, double fraction,
                             ProgressSink &progress) {
  job.progress = std::max(job.progress, std::min(fraction, 1.0));
  progress.observe(job.progress);
}

std::vector<TranscodeOutcome>
BatchProcessor::process(const std::vector<std::string> &input_files,
                        const RotationMode &mode,
                        const std::string &output_dir) {
  NullProgressSink progress;
  return process(input_files, mode, output_dir, progress);
}

std::vector<TranscodeOutcome>
BatchProcessor::process(const std::vector<std::string> &input_files,
                        const RotationMode &mode, const std::string &output_dir,
                        ProgressSink &progress) {
  validate(input_files, mode, output_dir);
  std::string filter = resolve_filter(mode);
  std::string transcoder = locate_transcoder(options_.transcoder);
  ensure_directory(output_dir);

  StagingDirectory staging(options_.staging_root);

  BatchJob job;
  job.requests.reserve(input_files.size());
  for (const auto &file : input_files) {
    job.requests.push_back({file, mode, output_dir});
  }
  const size_t total = job.requests.size();

  LOG_PHASE("================== BATCH ROTATION ==================");
  LOG_INFO("Files to process: {}", total);
  LOG_INFO("Rotation: {} ({})", describe(mode),
           is_lossless(mode) ? "lossless transpose" : "resampled");
  LOG_INFO("Filter: {}", filter);
  LOG_INFO("Transcoder: {}", transcoder);
  LOG_INFO("Output directory: {}", output_dir);
  LOG_INFO("Staging directory: {}", staging.path());
  LOG_PHASE("====================================================");

  auto batch_start = std::chrono::high_resolution_clock::now();

  std::vector<TranscodeOutcome> staged;
  staged.reserve(total);

  for (size_t i = 0; i < total; ++i) {
    const RotationRequest &request = job.requests[i];

    /// Reported before the item starts
    advance(job, static_cast<double>(i) / static_cast<double>(total),
            progress);

    /// Indexed staging name keeps colliding final names apart until
    /// finalization
    std::string staged_path =
        (fs::path(staging.path()) /
         fmt::format("{:04d}_{}", i,
                     rotated_file_name(request.input_path,
                                       options_.output_suffix)))
            .string();

    LOG_PHASE("----------------------------------------");
    LOG_INFO("[{}/{}] Processing: {}", i + 1, total,
             fs::path(request.input_path).filename().string());

    TranscodeOutcome outcome = execute_ffmpeg_rotate(
        transcoder, request, filter, staged_path, options_);

    if (outcome.ok) {
      LOG_SUCCESS("[{}/{}] Rotated: {} ({:.1f}s)", i + 1, total,
                  fs::path(request.input_path).filename().string(),
                  outcome.processing_time_us / 1000000.0);
    } else {
      LOG_ERROR("[{}/{}] Failed: {}", i + 1, total,
                fs::path(request.input_path).filename().string());
    }
    staged.push_back(std::move(outcome));
  }

  TIMER_START(finalize);
  std::vector<TranscodeOutcome> outcomes = finalize(job, staged);
  TIMER_END(finalize);

  advance(job, 1.0, progress);

  auto batch_end = std::chrono::high_resolution_clock::now();
  print_batch_summary(
      outcomes,
      std::chrono::duration<double>(batch_end - batch_start).count());

  return outcomes;
}

std::vector<TranscodeOutcome>
BatchProcessor::finalize(const BatchJob &job,
                         const std::vector<TranscodeOutcome> &staged) const {
  std::vector<TranscodeOutcome> outcomes;
  outcomes.reserve(staged.size());

  /// Final path -> index of the item that last wrote it
  std::map<std::string, size_t> written;

  for (size_t i = 0; i < staged.size(); ++i) {
    const TranscodeOutcome &item = staged[i];
    if (!item.ok) {
      outcomes.push_back(item);
      continue;
    }

    const RotationRequest &request = job.requests[i];
    std::string final_path = resolve_output_path(
        request.input_path, request.output_dir, options_.output_suffix);

    auto it = written.find(final_path);
    if (it != written.end()) {
      LOG_WARN("{} overwrites the output of item {} ({})",
               fs::path(request.input_path).filename().string(),
               it->second + 1, final_path);
    }

    std::string error;
    if (!move_file(item.output_path, final_path, error)) {
      LOG_ERROR("{}", error);
      outcomes.push_back(TranscodeOutcome::failure(
          item.input_path, error, item.processing_time_us));
      continue;
    }

    written[final_path] = i;
    outcomes.push_back(TranscodeOutcome::success(item.input_path, final_path,
                                                 item.processing_time_us));
  }
  return outcomes;
}

void BatchProcessor::print_batch_summary(
    const std::vector<TranscodeOutcome> &outcomes, double wall_clock_sec) {
  int total = static_cast<int>(outcomes.size());
  int failed = failure_count(outcomes);
  int success = total - failed;

  long total_time_us = 0;
  for (const auto &outcome : outcomes) {
    total_time_us += outcome.processing_time_us;
  }
  double sum_time_sec = total_time_us / 1000000.0;

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== BATCH ROTATION SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", total);
  fmt::print("{:<25} {:>25}\n", "Successful:", success);
  fmt::print("{:<25} {:>25}\n", "Failed:", failed);
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);

  if (total > 0) {
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per file:",
               sum_time_sec / total);
  }

  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);

  /// List failed files if any
  if (failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &outcome : outcomes) {
      if (!outcome.ok) {
        fmt::print(fg(fmt::color::red), "  - {}\n",
                   fs::path(outcome.input_path).filename().string());
      }
    }
    std::fflush(stdout);
  }
}

int failure_count(const std::vector<TranscodeOutcome> &outcomes) {
  return static_cast<int>(
      std::count_if(outcomes.begin(), outcomes.end(),
                    [](const TranscodeOutcome &o) { return !o.ok; }));
}

int batch_exit_code(const std::vector<TranscodeOutcome> &outcomes) {
  return std::min(failure_count(outcomes), kMaxExitFailures);
}

} // namespace ffrotate
