/**
 * @file logging.hpp
 * @brief Logging macros and stage timing collection utilities
 *
 * @details Provides:
 *          - Compile-time controlled logging macros (LOG_INFO, LOG_WARN, etc.)
 *
 *          - Runtime verbose switch for LOG_DEBUG
 *
 *          - Timing measurement macros (TIMER_START, TIMER_END)
 *
 *          - Thread-safe TimingCollector aggregating per-stage totals
 *
 * @note All logs use fmt::print for type-safe formatting and are flushed
 *       immediately so download, encode and upload lines interleave in the
 *       order they happened.
 *
 */

#ifndef NET_STAGE_LOGGING_HPP
#define NET_STAGE_LOGGING_HPP

#include <atomic>
#include <chrono>
#include <cstdio>
#include <map>
#include <mutex>
#include <string>

#include <fmt/color.h>
#include <fmt/core.h>

namespace net_stage {

// **----- LOGGING CONFIGURATION -----**

/**
 * @brief Logging is controlled by ENABLE_LOGGING at compile time.
 */
#ifndef ENABLE_LOGGING
#define ENABLE_LOGGING 1
#endif

#ifndef ENABLE_TIMING
#define ENABLE_TIMING 1
#endif

/// Global log mutex (defined in logging.cpp)
extern std::mutex log_mutex;

/**
 * @brief Enable or disable LOG_DEBUG output.
 */
void set_verbose(bool enabled);

/**
 * @brief Whether LOG_DEBUG output is enabled.
 */
bool verbose_enabled();

// **----- LOGGING MACROS -----**

#if ENABLE_LOGGING
#define LOG_DEBUG(format_str, ...)                                             \
  do {                                                                         \
    if (net_stage::verbose_enabled()) {                                        \
      std::lock_guard<std::mutex> lock(net_stage::log_mutex);                  \
      fmt::print(fg(fmt::color::gray), "[DEBUG] " format_str "\n",             \
                 ##__VA_ARGS__);                                               \
      std::fflush(stdout);                                                     \
    }                                                                          \
  } while (0)

#define LOG_INFO(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(net_stage::log_mutex);                    \
    fmt::print("[INFO] " format_str "\n", ##__VA_ARGS__);                      \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_WARN(format_str, ...)                                              \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(net_stage::log_mutex);                    \
    fmt::print(fg(fmt::color::yellow), "[WARN] " format_str "\n",              \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_ERROR(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(net_stage::log_mutex);                    \
    fmt::print(fg(fmt::color::red), "[ERROR] " format_str "\n",                \
               ##__VA_ARGS__);                                                 \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_PHASE(format_str, ...)                                             \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(net_stage::log_mutex);                    \
    fmt::print(fg(fmt::color::cyan), format_str "\n", ##__VA_ARGS__);          \
    std::fflush(stdout);                                                       \
  } while (0)

#define LOG_SUCCESS(format_str, ...)                                           \
  do {                                                                         \
    std::lock_guard<std::mutex> lock(net_stage::log_mutex);                    \
    fmt::print(fg(fmt::color::green), format_str "\n", ##__VA_ARGS__);         \
    std::fflush(stdout);                                                       \
  } while (0)
#else
#define LOG_DEBUG(...) ((void)0)
#define LOG_INFO(...) ((void)0)
#define LOG_WARN(...) ((void)0)
#define LOG_ERROR(...) ((void)0)
#define LOG_PHASE(...) ((void)0)
#define LOG_SUCCESS(...) ((void)0)
#endif

// **----- TIMING COLLECTION -----**

/**
 * @brief StageTiming: accumulated time spent in one stage.
 */
struct StageTiming {
  long microseconds = 0; //< Total duration in microseconds
  long count = 0;        //< Number of recorded runs
};

/**
 * @class TimingCollector
 * @brief Thread-safe singleton for collecting per-stage timings.
 * @note The download, encode and upload workers all record here.
 */
class TimingCollector {
  static std::mutex timing_mutex;
  static std::map<std::string, StageTiming> stages;

public:
  /**
   * @brief Record one run of a stage.
   * @param name Stage name
   * @param us Duration in microseconds
   */
  static void record(const std::string &name, long us);

  /**
   * @brief Accumulated timing of a stage (zero if never recorded).
   */
  static StageTiming get(const std::string &name);

  /**
   * @brief Print all stages as a formatted table.
   *        Called at program end for summary.
   */
  static void print_summary();

  /**
   * @brief Clear all collected timings.
   */
  static void clear();
};

// **----- TIMING MACROS -----**

#if ENABLE_TIMING
#define TIMER_START(name)                                                      \
  auto timer_start_##name = std::chrono::steady_clock::now()

#define TIMER_END(name)                                                        \
  do {                                                                         \
    auto timer_end_##name = std::chrono::steady_clock::now();                  \
    auto timer_duration_##name =                                               \
        std::chrono::duration_cast<std::chrono::microseconds>(                 \
            timer_end_##name - timer_start_##name)                             \
            .count();                                                          \
    net_stage::TimingCollector::record(#name, timer_duration_##name);          \
  } while (0)
#else
#define TIMER_START(name) ((void)0)
#define TIMER_END(name) ((void)0)
#endif

} // namespace net_stage

#endif // NET_STAGE_LOGGING_HPP
