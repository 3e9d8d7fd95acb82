/**
 * @file stage_queue.hpp
 * @brief Thread-safe FIFO connecting two pipeline stages
 *
 * @details The coordinator owns three of these:
 *
 *          - download queue: PENDING records waiting for the download worker
 *
 *          - encode queue: LOCAL records waiting for the encode loop
 *
 *          - upload queue: UPLOADING records waiting for the upload worker
 *
 *          Items are source paths (the FileRecord identity key); the records
 *          themselves stay in the coordinator's registry.
 */

#ifndef NET_STAGE_STAGE_QUEUE_HPP
#define NET_STAGE_STAGE_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>

namespace net_stage {

/**
 * @class StageQueue
 * @brief Thread-safe queue of record keys (producer-consumer pattern).
 *
 * @attention USAGE:
 *
 *   - The upstream stage calls push() after a successful transition
 *
 *   - The downstream stage calls pop_for() in a loop; the timeout lets it
 *     re-check cancellation and its exit condition between waits
 */
class StageQueue {
public:
  /**
   * @brief Push a record key to the back of the queue.
   */
  void push(std::string key);

  /**
   * @brief Pop the front key, waiting at most `timeout`.
   * @param key Output: the popped key
   * @return true if a key was retrieved, false on timeout
   */
  bool pop_for(std::string &key, std::chrono::milliseconds timeout);

  /**
   * @brief Drop every queued key.
   */
  void clear();

  bool empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.empty();
  }

  size_t size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return keys_.size();
  }

private:
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::queue<std::string> keys_;
};

} // namespace net_stage

#endif // NET_STAGE_STAGE_QUEUE_HPP
