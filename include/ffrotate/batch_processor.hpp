/**
 * @file batch_processor.hpp
 * @brief Sequential batch rotation
 *
 * @details The BatchProcessor class runs one rotation over a list of videos:
 *
 *          - Validates the job before anything touches the filesystem
 *
 *          - Resolves the transcoder and the filter once per batch
 *
 *          - Transcodes each item into a private staging directory, one at
 *            a time, in input order
 *
 *          - Moves every produced file into the output directory
 *
 *          - Removes the staging directory on every exit path
 *
 * @note A failing item is recorded and the batch continues. Only job-level
 *       problems (see ErrorKind) are thrown.
 */

#ifndef FFROTATE_BATCH_PROCESSOR_HPP
#define FFROTATE_BATCH_PROCESSOR_HPP

#include <string>
#include <vector>

#include "ffmpeg_executor.hpp"
#include "progress.hpp"
#include "types.hpp"

namespace ffrotate {

/**
 * @class BatchProcessor
 * @brief Orchestrates a batch of rotations with partial-failure semantics.
 *
 * @attention WORKFLOW:
 *
 * 1. Validate: EmptyBatch, MissingAngle, NoOutputDirectory, InvalidAngle
 *
 * 2. Locate FFmpeg (TranscoderNotFound) and create the output directory
 *
 * 3. For item i of n: report i/n, transcode into staging, record outcome
 *
 * 4. Move staged outputs to their final names, report 1.0
 */
class BatchProcessor {
public:
  /**
   * @brief Construct a batch processor.
   * @param options Transcoder, encoder and staging settings
   */
  explicit BatchProcessor(TranscodeOptions options = TranscodeOptions());

  /**
   * @brief Rotate all input files.
   *
   * @param input_files Input video paths, processed in this order
   * @param mode Rotation applied to every file
   * @param output_dir Destination directory (created if missing)
   * @param progress Receives progress fractions
   * @return One outcome per input, in input order
   * @throws RotateError for job-level failures, before any item runs
   */
  std::vector<TranscodeOutcome>
  process(const std::vector<std::string> &input_files, const RotationMode &mode,
          const std::string &output_dir, ProgressSink &progress);

  /// Same as above without progress reporting
  std::vector<TranscodeOutcome>
  process(const std::vector<std::string> &input_files, const RotationMode &mode,
          const std::string &output_dir);

  const TranscodeOptions &options() const { return options_; }

private:
  TranscodeOptions options_; //< Settings shared by every item

  /**
   * @brief Job-level checks that need no I/O.
   * @throws RotateError (EmptyBatch, MissingAngle, NoOutputDirectory)
   */
  static void validate(const std::vector<std::string> &input_files,
                       const RotationMode &mode,
                       const std::string &output_dir);

  /// Raise job progress and forward it to the sink
  static void advance(BatchJob &job, double fraction, ProgressSink &progress);

  /**
   * @brief Move staged outputs into the output directory.
   * @param job The batch
   * @param staged Outcomes whose output_path points into staging
   * @return Outcomes with final output paths; failed moves become failures
   */
  std::vector<TranscodeOutcome>
  finalize(const BatchJob &job,
           const std::vector<TranscodeOutcome> &staged) const;

  /**
   * @brief Print final batch summary.
   * @param outcomes Final outcomes
   * @param wall_clock_sec Actual elapsed wall-clock time in seconds
   */
  static void print_batch_summary(const std::vector<TranscodeOutcome> &outcomes,
                                  double wall_clock_sec);
};

/// Number of failed items
int failure_count(const std::vector<TranscodeOutcome> &outcomes);

/// Largest failure count reported as an exit status (8-bit, below 126)
constexpr int kMaxExitFailures = 125;

/**
 * @brief Process exit status for a finished batch.
 * @return 0 when every item succeeded, otherwise the failure count capped at
 *         kMaxExitFailures so it never wraps to 0 modulo 256
 */
int batch_exit_code(const std::vector<TranscodeOutcome> &outcomes);

} // namespace ffrotate

#endif // FFROTATE_BATCH_PROCESSOR_HPP
