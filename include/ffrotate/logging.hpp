/**
 * @file logging.hpp
 * @brief Logging macros and timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector for aggregating per-phase durations
 *
 * @note Lines are flushed immediately so progress stays visible while a
 *       transcoder child is running. WARN/ERROR are written to stderr.
 */

#ifndef FFROTATE_LOGGING_HPP
#define FFROTATE_LOGGING_HPP

#include <chrono>
#include <cstdio>
#include <mutex>
#include <string>
#include <vector>

#include <fmt/color.h>
#include <fmt/core.h>

namespace ffrotate {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by FFROTATE_ENABLE_LOGGING at compile time.
 */
#ifndef FFROTATE_ENABLE_LOGGING
#define FFROTATE_ENABLE_LOGGING 1
#endif

#ifndef FFROTATE_ENABLE_TIMING
#define FFROTATE_ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

// **----- LOGGING MACROS -----**

#if FFROTATE_ENABLE_LOGGING
// Warnings and errors go to stderr so per-item results on stdout stay clean.
#define FFROTATE_LOG_TO(stream, style, format_str, ...)                        \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(ffrotate::log_mutex);                     \
    fmt::print(stream, style, format_str "\n", ##__VA_ARGS__);                 \
    std::fflush(stream);                                                       \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  FFROTATE_LOG_TO(stdout, fmt::text_style(), "[INFO] " format_str,             \
                  ##__VA_ARGS__)
#define LOG_WARN(format_str, ...)                                              \
  FFROTATE_LOG_TO(stderr, fg(fmt::color::yellow), "[WARN] " format_str,        \
                  ##__VA_ARGS__)
#define LOG_ERROR(format_str, ...)                                             \
  FFROTATE_LOG_TO(stderr, fg(fmt::color::red), "[ERROR] " format_str,          \
                  ##__VA_ARGS__)
#define LOG_PHASE(format_str, ...)                                             \
  FFROTATE_LOG_TO(stdout, fg(fmt::color::cyan), format_str, ##__VA_ARGS__)
#define LOG_SUCCESS(format_str, ...)                                           \
  FFROTATE_LOG_TO(stdout, fg(fmt::color::green), format_str, ##__VA_ARGS__)
#else
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/// One recorded phase of a run (probe, transcode, finalize...).
struct TimingEntry {
  std::string name;  //< Phase name, as given to TIMER_START
  long microseconds; //< Wall-clock duration
};

/**
 * @class TimingCollector
 * @brief Process-wide list of phase durations, printed by the CLI at exit.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::vector<TimingEntry> entries;

public:
  static void record(const std::string &name, long us);

  /// Prints the table followed by a total row. No-op when nothing was recorded.
  static void print_summary();

  static void clear();
  static size_t size();
};

// **----- TIMING MACROS -----**

#if FFROTATE_ENABLE_TIMING
#define TIMER_START(name)                                                      \
  const auto ffrotate_t0_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  ffrotate::TimingCollector::record(                                           \
      #name, static_cast<long>(                                                \
                 std::chrono::duration_cast<std::chrono::microseconds>(        \
                     std::chrono::steady_clock::now() - ffrotate_t0_##name)    \
                     .count()))
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace ffrotate

#endif // FFROTATE_LOGGING_HPP
