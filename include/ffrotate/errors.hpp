/**
 * @file errors.hpp
 * @brief Job-level error kinds
 *
 * @details Errors that abort a whole operation (a batch or a preview) are
 *          thrown as RotateError. Per-item problems inside a batch are never
 *          thrown; they are recorded as TranscodeOutcome::failure().
 */

#ifndef FFROTATE_ERRORS_HPP
#define FFROTATE_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace ffrotate {

enum class ErrorKind {
  EmptyBatch,
  MissingAngle,
  InvalidAngle,
  NoOutputDirectory,
  OutputDirectoryUnavailable,
  TranscoderNotFound,
  StagingUnavailable,
  DurationUnavailable,
  FrameExtractionFailed,
  FrameDecodeFailed
};

/// Stable name of an error kind, used in log lines and CLI output
const char *error_kind_name(ErrorKind kind);

/**
 * @class RotateError
 * @brief Fatal error for the current operation.
 */
class RotateError : public std::runtime_error {
public:
  RotateError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  ErrorKind kind() const { return kind_; }

private:
  ErrorKind kind_;
};

} // namespace ffrotate

#endif // FFROTATE_ERRORS_HPP
