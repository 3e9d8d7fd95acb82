/**
 * @file stage_queue.cpp
 * @brief Stage queue implementation
 */

#include "net_stage/stage_queue.hpp"

namespace net_stage {

void StageQueue::push(std::string key) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    keys_.push(std::move(key));
  }
  cv_.notify_one();
}

bool StageQueue::pop_for(std::string &key, std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  if (!cv_.wait_for(lock, timeout, [this] { return !keys_.empty(); })) {
    return false;
  }

  key = std::move(keys_.front());
  keys_.pop();
  return true;
}

void StageQueue::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::queue<std::string>().swap(keys_);
}

} // namespace net_stage
