/**
 * @file errors.cpp
 * @brief Error kind names
 */

#include "ffrotate/errors.hpp"

namespace ffrotate {

const char *error_kind_name(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::EmptyBatch:
    return "EmptyBatch";
  case ErrorKind::MissingAngle:
    return "MissingAngle";
  case ErrorKind::InvalidAngle:
    return "InvalidAngle";
  case ErrorKind::NoOutputDirectory:
    return "NoOutputDirectory";
  case ErrorKind::OutputDirectoryUnavailable:
    return "OutputDirectoryUnavailable";
  case ErrorKind::TranscoderNotFound:
    return "TranscoderNotFound";
  case ErrorKind::StagingUnavailable:
    return "StagingUnavailable";
  case ErrorKind::DurationUnavailable:
    return "DurationUnavailable";
  case ErrorKind::FrameExtractionFailed:
    return "FrameExtractionFailed";
  case ErrorKind::FrameDecodeFailed:
    return "FrameDecodeFailed";
  }
  return "Unknown";
}

} // namespace ffrotate
