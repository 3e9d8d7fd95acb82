/**
 * @file cancellation.cpp
 * @brief Cancellation token and keyboard shutdown listener implementation
 */

#include "net_stage/cancellation.hpp"

#include <algorithm>
#include <cctype>

#include <sys/select.h>
#include <termios.h>
#include <unistd.h>

#include "net_stage/logging.hpp"

namespace net_stage {

// **---- CancellationToken ----**

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
  /// Sleep in short slices so a request is noticed promptly
  constexpr std::chrono::milliseconds slice{50};
  auto deadline = std::chrono::steady_clock::now() + duration;

  while (!requested()) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      return false;
    auto remaining =
        std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
    std::this_thread::sleep_for(std::min(slice, remaining));
  }
  return true;
}

// **---- ShutdownListener ----**

ShutdownListener::ShutdownListener(CancellationToken &token, char shutdown_key)
    : token_(token),
      shutdown_key_(static_cast<char>(
          std::tolower(static_cast<unsigned char>(shutdown_key)))) {}

ShutdownListener::~ShutdownListener() { stop(); }

bool ShutdownListener::start() {
  if (thread_.joinable())
    return true;

  if (!isatty(STDIN_FILENO)) {
    LOG_DEBUG("stdin is not a TTY, shutdown key disabled");
    return false;
  }

  stop_.store(false);
  thread_ = std::thread(&ShutdownListener::listen, this);
  return true;
}

void ShutdownListener::stop() {
  stop_.store(true);
  if (thread_.joinable())
    thread_.join();
}

void ShutdownListener::listen() {
  struct termios old_settings;
  if (tcgetattr(STDIN_FILENO, &old_settings) != 0) {
    LOG_WARN("Cannot read terminal settings, shutdown key disabled");
    return;
  }

  /// Raw-ish mode: no line buffering, no echo, signals still delivered
  struct termios raw = old_settings;
  raw.c_lflag &= ~(ICANON | ECHO);
  raw.c_cc[VMIN] = 0;
  raw.c_cc[VTIME] = 0;
  if (tcsetattr(STDIN_FILENO, TCSANOW, &raw) != 0) {
    LOG_WARN("Cannot switch terminal to raw mode, shutdown key disabled");
    return;
  }

  while (!stop_.load() && !token_.requested()) {
    fd_set fds;
    FD_ZERO(&fds);
    FD_SET(STDIN_FILENO, &fds);
    struct timeval tv {
      0, 100000
    }; //< 100 ms

    int ready = select(STDIN_FILENO + 1, &fds, nullptr, nullptr, &tv);
    if (ready < 0)
      break;
    if (ready == 0)
      continue;

    char c = 0;
    if (read(STDIN_FILENO, &c, 1) != 1)
      continue;

    if (std::tolower(static_cast<unsigned char>(c)) == shutdown_key_) {
      LOG_WARN("Shutdown requested, finishing current files...");
      token_.request();
      break;
    }
  }

  tcsetattr(STDIN_FILENO, TCSADRAIN, &old_settings);
}

} // namespace net_stage
