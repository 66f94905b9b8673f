/**
 * @file logging.cpp
 * @brief Log mutex and TimingCollector storage
 */

#include "ffrotate/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace ffrotate {

std::mutex log_mutex;

std::mutex TimingCollector::timing_mutex;
std::vector<TimingEntry> TimingCollector::entries;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.push_back({name, us});
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (entries.empty())
    return;

  const auto row = [](const std::string &label, long us) {
    fmt::print("  {:<26} {:>12} us  {:>8.3f}s\n", label, us, us / 1e6);
  };

  long total_us = 0;
  fmt::print(fg(fmt::color::cyan), "\n-- phase timings ({} recorded) --\n",
             entries.size());
  for (const auto &e : entries) {
    row(e.name, e.microseconds);
    total_us += e.microseconds;
  }
  row("total", total_us);
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  entries.clear();
}

size_t TimingCollector::size() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  return entries.size();
}

} // namespace ffrotate
