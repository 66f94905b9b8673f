/**
 * @file progress.cpp
 * @brief Progress sink implementation
 */

#include "ffrotate/progress.hpp"

#include <cmath>

#include "ffrotate/logging.hpp"

namespace ffrotate {

void LogProgressSink::observe(double fraction) {
  auto done = static_cast<size_t>(std::lround(fraction * total_));
  LOG_INFO("Progress: {}/{} ({:.0f}%)", done, total_, fraction * 100.0);
}

} // namespace ffrotate
