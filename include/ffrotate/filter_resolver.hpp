/**
 * @file filter_resolver.hpp
 * @brief Rotation mode to FFmpeg filter expression mapping
 *
 * @details The three fixed modes map to transpose filters, which rearrange
 *          pixels without resampling:
 *
 *          - 90  -> transpose=1 (90 degrees clockwise)
 *
 *          - 180 -> transpose=2,transpose=2 (two exact quarter turns)
 *
 *          - 270 -> transpose=2 (90 degrees counter-clockwise)
 *
 *          Custom angles use the generic rotate filter with bilinear
 *          interpolation disabled. That path resamples and is not lossless.
 */

#ifndef FFROTATE_FILTER_RESOLVER_HPP
#define FFROTATE_FILTER_RESOLVER_HPP

#include <string>

#include "types.hpp"

namespace ffrotate {

/**
 * @brief Resolve the video filter expression for a rotation.
 * @param mode Requested rotation
 * @return Filter expression for -vf
 * @throws RotateError (InvalidAngle) for Custom without a finite angle
 */
std::string resolve_filter(const RotationMode &mode);

/// True for pure transpositions (90/180/270)
bool is_lossless(const RotationMode &mode);

} // namespace ffrotate

#endif // FFROTATE_FILTER_RESOLVER_HPP
