/**
 * @file logging.cpp
 * @brief Logging and timing utilities implementation
 *
 * @details Provides static member definitions for:
 *          - Global log mutex and verbose switch
 *
 *          - TimingCollector static members and methods
 */

#include "net_stage/logging.hpp"

#include <fmt/color.h>
#include <fmt/core.h>

namespace net_stage {

// **----- GLOBAL LOG STATE -----**

std::mutex log_mutex;

namespace {
std::atomic<bool> verbose_flag{false};
} // anonymous namespace

void set_verbose(bool enabled) { verbose_flag.store(enabled); }

bool verbose_enabled() { return verbose_flag.load(); }

// **----- TIMING COLLECTOR STATIC MEMBERS -----**

std::mutex TimingCollector::timing_mutex;
std::map<std::string, StageTiming> TimingCollector::stages;

void TimingCollector::record(const std::string &name, long us) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  StageTiming &t = stages[name];
  t.microseconds += us;
  t.count++;
}

StageTiming TimingCollector::get(const std::string &name) {
  std::lock_guard<std::mutex> lock(timing_mutex);
  auto it = stages.find(name);
  return it == stages.end() ? StageTiming{} : it->second;
}

void TimingCollector::print_summary() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  if (stages.empty())
    return;

  std::lock_guard<std::mutex> log_lock(log_mutex);
  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "================== TIMING SUMMARY ==================\n");
  fmt::print("{:<14} {:>6} {:>14} {:>14}\n", "Stage", "Runs", "Total [s]",
             "Avg [s]");
  fmt::print("{:-<14} {:-<6} {:-<14} {:-<14}\n", "", "", "", "");

  for (const auto &entry : stages) {
    double seconds = entry.second.microseconds / 1000000.0;
    double avg = entry.second.count > 0 ? seconds / entry.second.count : 0.0;
    fmt::print("{:<14} {:>6} {:>14.2f} {:>14.2f}\n", entry.first,
               entry.second.count, seconds, avg);
  }
  fmt::print(fg(fmt::color::cyan),
             "====================================================\n");
  std::fflush(stdout);
}

void TimingCollector::clear() {
  std::lock_guard<std::mutex> lock(timing_mutex);
  stages.clear();
}

} // namespace net_stage
