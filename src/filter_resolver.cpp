/**
 * @file filter_resolver.cpp
 * @brief Rotation mode to filter expression implementation
 */

#include "ffrotate/filter_resolver.hpp"

#include <cmath>

#include <fmt/core.h>

#include "ffrotate/errors.hpp"

namespace ffrotate {

std::string resolve_filter(const RotationMode &mode) {
  switch (mode.kind) {
  case RotationMode::Kind::Deg90:
    return "transpose=1";
  case RotationMode::Kind::Deg180:
    return "transpose=2,transpose=2";
  case RotationMode::Kind::Deg270:
    return "transpose=2";
  case RotationMode::Kind::Custom:
    break;
  }

  if (!mode.angle || !std::isfinite(*mode.angle)) {
    throw RotateError(ErrorKind::InvalidAngle,
                      "Custom rotation requires a finite angle in degrees");
  }
  return fmt::format("rotate={}*(PI/180):bilinear=0", *mode.angle);
}

bool is_lossless(const RotationMode &mode) { return !mode.is_custom(); }

// **---- RotationMode helpers ----**

std::optional<RotationMode> parse_rotation_mode(const std::string &selection,
                                                std::optional<double> angle) {
  if (selection == "90")
    return RotationMode::deg90();
  if (selection == "180")
    return RotationMode::deg180();
  if (selection == "270")
    return RotationMode::deg270();
  if (selection == "custom")
    return RotationMode::custom(angle);
  return std::nullopt;
}

std::string describe(const RotationMode &mode) {
  switch (mode.kind) {
  case RotationMode::Kind::Deg90:
    return "90";
  case RotationMode::Kind::Deg180:
    return "180";
  case RotationMode::Kind::Deg270:
    return "270";
  case RotationMode::Kind::Custom:
    break;
  }
  return mode.angle ? fmt::format("custom({})", *mode.angle) : "custom(?)";
}

} // namespace ffrotate
