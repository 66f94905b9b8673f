/**
 * @file types.hpp
 * @brief Core data types for ffrotate
 *
 * @details Contains the data structures passed between pipeline stages:
 *          - RotationMode: requested rotation (fixed transposition or custom)
 *
 *          - RotationRequest: one batch item
 *
 *          - TranscodeOutcome: per-item result (success or failure)
 *
 *          - BatchJob: the requests of one batch call and its progress
 *
 *          - ProbeResult: media duration from a probe call
 */

#ifndef FFROTATE_TYPES_HPP
#define FFROTATE_TYPES_HPP

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace ffrotate {

// **----- ROTATION -----**

/**
 * @struct RotationMode
 * @brief Rotation applied uniformly to a batch.
 * @note Fixed modes are lossless pixel transpositions. Custom rotates by an
 *       arbitrary angle (degrees, signed, clockwise) and resamples.
 */
struct RotationMode {
  enum class Kind { Deg90, Deg180, Deg270, Custom };

  Kind kind = Kind::Deg90;
  std::optional<double> angle; //< Only meaningful for Kind::Custom

  static RotationMode deg90() { return {Kind::Deg90, std::nullopt}; }
  static RotationMode deg180() { return {Kind::Deg180, std::nullopt}; }
  static RotationMode deg270() { return {Kind::Deg270, std::nullopt}; }
  static RotationMode custom(std::optional<double> degrees) {
    return {Kind::Custom, degrees};
  }

  bool is_custom() const { return kind == Kind::Custom; }
};

/**
 * @brief Parse a rotation selection ("90", "180", "270", "custom").
 * @param selection Selection string from the caller
 * @param angle Optional angle, only kept for "custom"
 * @return The mode, or std::nullopt for an unknown selection
 */
std::optional<RotationMode> parse_rotation_mode(const std::string &selection,
                                                std::optional<double> angle);

/// Human readable label, e.g. "90" or "custom(12.5)"
std::string describe(const RotationMode &mode);

/**
 * @struct RotationRequest
 * @brief A single batch item, immutable once created.
 */
struct RotationRequest {
  std::string input_path; //< Resolved filesystem path of the input
  RotationMode mode;      //< Rotation to apply
  std::string output_dir; //< Caller-declared destination directory
};

// **----- RESULTS -----**

/**
 * @struct TranscodeOutcome
 * @brief Result of one rotation attempt.
 * @note Created through success() / failure(); never modified afterwards.
 */
struct TranscodeOutcome {
  std::string input_path;      //< Input the outcome belongs to
  bool ok = false;             //< Whether a rotated file was produced
  std::string output_path;     //< Produced file (ok == true)
  std::string message;         //< Diagnostic text (ok == false)
  long processing_time_us = 0; //< Wall time spent on this item

  static TranscodeOutcome success(std::string input, std::string output,
                                  long elapsed_us = 0) {
    TranscodeOutcome o;
    o.input_path = std::move(input);
    o.ok = true;
    o.output_path = std::move(output);
    o.processing_time_us = elapsed_us;
    return o;
  }

  static TranscodeOutcome failure(std::string input, std::string msg,
                                  long elapsed_us = 0) {
    TranscodeOutcome o;
    o.input_path = std::move(input);
    o.ok = false;
    o.message = std::move(msg);
    o.processing_time_us = elapsed_us;
    return o;
  }
};

/**
 * @struct BatchJob
 * @brief Requests of one batch call.
 * @note Owned by BatchProcessor::process for the duration of the call.
 *       progress never decreases.
 */
struct BatchJob {
  std::vector<RotationRequest> requests;
  double progress = 0;
};

/**
 * @struct ProbeResult
 * @brief Media duration reported by the transcoder.
 */
struct ProbeResult {
  double duration_seconds = 0; //< Always >= 0
};

} // namespace ffrotate

#endif // FFROTATE_TYPES_HPP
