/**
 * @file backpressure.cpp
 * @brief Download admission control implementation
 */

#include "net_stage/backpressure.hpp"

#include "net_stage/logging.hpp"

namespace net_stage {

BackpressureController::BackpressureController(size_t max_buffer_size,
                                               uint64_t max_staging_bytes,
                                               const StagingArea &staging,
                                               LocalCountFn local_count)
    : max_buffer_size_(max_buffer_size), max_staging_bytes_(max_staging_bytes),
      staging_(staging), local_count_(std::move(local_count)) {}

PauseReason BackpressureController::check() const {
  PauseReason reason = PauseReason::None;
  uint64_t usage = 0;

  if (local_count_() >= max_buffer_size_) {
    reason = PauseReason::BufferFull;
  } else if (max_staging_bytes_ > 0) {
    usage = staging_.usage_bytes();
    if (usage >= max_staging_bytes_)
      reason = PauseReason::QuotaReached;
  }

  PauseReason previous = last_reason_.exchange(reason);
  if (reason != previous) {
    if (reason == PauseReason::BufferFull) {
      LOG_DEBUG("Downloads paused: {} files waiting for the encoder",
                max_buffer_size_);
    } else if (reason == PauseReason::QuotaReached) {
      LOG_WARN("Staging storage limit reached: {:.2f} GB",
               usage / (1024.0 * 1024.0 * 1024.0));
    } else {
      LOG_DEBUG("Downloads resumed");
    }
  }
  return reason;
}

} // namespace net_stage
