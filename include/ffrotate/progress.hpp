/**
 * @file progress.hpp
 * @brief Batch progress reporting
 *
 * @details BatchProcessor reports a fraction in [0, 1] through a
 *          ProgressSink before each item starts and once more (1.0) after
 *          finalization. Values are non-decreasing within one batch.
 */

#ifndef FFROTATE_PROGRESS_HPP
#define FFROTATE_PROGRESS_HPP

#include <cstddef>

namespace ffrotate {

/**
 * @class ProgressSink
 * @brief Receiver of batch progress.
 */
class ProgressSink {
public:
  virtual ~ProgressSink() = default;

  /// Called with the fraction of the batch dispatched so far
  virtual void observe(double fraction) = 0;
};

/// Sink that ignores everything
class NullProgressSink : public ProgressSink {
public:
  void observe(double) override {}
};

/**
 * @class LogProgressSink
 * @brief Logs progress as "Progress: n/total (pct%)".
 */
class LogProgressSink : public ProgressSink {
public:
  explicit LogProgressSink(size_t total) : total_(total) {}

  void observe(double fraction) override;

private:
  size_t total_;
};

} // namespace ffrotate

#endif // FFROTATE_PROGRESS_HPP
