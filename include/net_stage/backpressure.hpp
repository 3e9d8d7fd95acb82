/**
 * @file backpressure.hpp
 * @brief Admission control for the download stage
 *
 * @details The download worker asks should_pause_downloads() before claiming
 *          a new record. Two independent limits apply:
 *
 *          - Count: number of LOCAL records (downloaded, not yet picked up by
 *            the encode loop) has reached max_buffer_size
 *
 *          - Bytes: the staging directory holds at least max_staging_bytes
 *            (skipped when the quota is 0)
 *
 * @note Both limits are evaluated against live state on every call: the
 *       registry count through a callback, the byte usage by listing the
 *       staging directory. Nothing is cached, so encode-loop consumption and
 *       upload cleanup are seen immediately.
 */

#ifndef NET_STAGE_BACKPRESSURE_HPP
#define NET_STAGE_BACKPRESSURE_HPP

#include <atomic>
#include <cstdint>
#include <functional>

#include "staging_area.hpp"

namespace net_stage {

/**
 * @enum PauseReason
 * @brief Why downloads are currently held back.
 */
enum class PauseReason { None, BufferFull, QuotaReached };

/**
 * @class BackpressureController
 * @brief Decides whether the download stage may admit more work.
 */
class BackpressureController {
public:
  /// Returns the current number of LOCAL records
  using LocalCountFn = std::function<size_t()>;

  /**
   * @param max_buffer_size Count limit on LOCAL records
   * @param max_staging_bytes Byte quota of the staging directory (0 = none)
   * @param staging Staging directory to measure (must outlive this object)
   * @param local_count Live LOCAL count provider
   */
  BackpressureController(size_t max_buffer_size, uint64_t max_staging_bytes,
                         const StagingArea &staging, LocalCountFn local_count);

  /**
   * @brief Evaluate both limits.
   */
  PauseReason check() const;

  /**
   * @brief true while either limit is reached.
   */
  bool should_pause_downloads() const { return check() != PauseReason::None; }

  size_t max_buffer_size() const { return max_buffer_size_; }
  uint64_t max_staging_bytes() const { return max_staging_bytes_; }

private:
  size_t max_buffer_size_;
  uint64_t max_staging_bytes_;
  const StagingArea &staging_;
  LocalCountFn local_count_;

  /// Last reported reason, so a sustained pause is logged once
  mutable std::atomic<PauseReason> last_reason_{PauseReason::None};
};

} // namespace net_stage

#endif // NET_STAGE_BACKPRESSURE_HPP
