/**
 * @file cancellation.hpp
 * @brief Cooperative cancellation shared by the pipeline stages
 *
 * @details Provides:
 *
 *          - CancellationToken: flag polled by every stage between units of
 *            work, passed explicitly into the coordinator
 *
 *          - ShutdownListener: requests cancellation when the shutdown key is
 *            pressed on an interactive terminal
 *
 * @note Cancellation never interrupts a copy or an encode in progress; the
 *       current file is finished first.
 */

#ifndef NET_STAGE_CANCELLATION_HPP
#define NET_STAGE_CANCELLATION_HPP

#include <atomic>
#include <chrono>
#include <thread>

namespace net_stage {

/**
 * @class CancellationToken
 * @brief Cooperative stop flag.
 *
 * @attention request() only stores to a lock-free atomic, so it may be called
 *            from a signal handler.
 */
class CancellationToken {
public:
  /// Ask every stage to stop after its current unit of work.
  void request() { requested_.store(true); }

  /// Whether a stop was requested.
  bool requested() const { return requested_.load(); }

  /// Clear the flag so the token can drive another run.
  void reset() { requested_.store(false); }

  /**
   * @brief Sleep for up to `duration`, waking early on request().
   * @return true if cancellation was requested
   */
  bool sleep_for(std::chrono::milliseconds duration) const;

private:
  std::atomic<bool> requested_{false};
};

/**
 * @class ShutdownListener
 * @brief Background keyboard listener for graceful shutdown.
 *
 * @attention BEHAVIOR:
 *
 *   - Only active when stdin is a TTY (redirected / piped input is ignored)
 *
 *   - Puts the terminal in raw mode and polls stdin with a 100 ms select()
 *
 *   - Pressing the shutdown key calls token.request() and ends the listener
 *
 *   - Terminal settings are restored when the listener thread exits
 */
class ShutdownListener {
public:
  explicit ShutdownListener(CancellationToken &token, char shutdown_key = 'q');
  ~ShutdownListener();

  /// Disable copy
  ShutdownListener(const ShutdownListener &) = delete;
  ShutdownListener &operator=(const ShutdownListener &) = delete;

  /**
   * @brief Start the listener thread.
   * @return true if listening, false when stdin is not a TTY
   */
  bool start();

  /**
   * @brief Stop and join the listener thread.
   */
  void stop();

  /// Whether the listener thread is running.
  bool active() const { return thread_.joinable(); }

private:
  CancellationToken &token_;
  char shutdown_key_;
  std::atomic<bool> stop_{false};
  std::thread thread_;

  void listen();
};

} // namespace net_stage

#endif // NET_STAGE_CANCELLATION_HPP
