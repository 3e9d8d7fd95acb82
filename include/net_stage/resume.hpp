/**
 * @file resume.hpp
 * @brief Resume reconciliation of persisted records against the filesystem
 *
 * @details Maps (loaded state, which staging artifacts still exist) to the
 *          state a record restarts from and the stage queue it re-enters.
 *          Pure function: the caller probes the filesystem and applies the
 *          decision.
 *
 * @attention TABLE:
 *
 *   - COMPLETE, FAILED                 -> unchanged, not requeued
 *
 *   - PENDING                          -> download
 *
 *   - DOWNLOADING                      -> PENDING, download (partial copy)
 *
 *   - LOCAL / ENCODING, local present  -> LOCAL, encode
 *
 *   - LOCAL / ENCODING, local missing  -> PENDING, download
 *
 *   - UPLOADING, output present        -> UPLOADING, upload
 *
 *   - UPLOADING, only local present    -> LOCAL, encode
 *
 *   - UPLOADING, nothing present       -> PENDING, download
 */

#ifndef NET_STAGE_RESUME_HPP
#define NET_STAGE_RESUME_HPP

#include "types.hpp"

namespace net_stage {

/**
 * @enum RequeueTarget
 * @brief Stage queue a reconciled record is pushed to.
 */
enum class RequeueTarget { None, Download, Encode, Upload };

/**
 * @struct ArtifactPresence
 * @brief Which staging files of a record exist on disk right now.
 */
struct ArtifactPresence {
  bool local_exists = false;  //< local_path is set and the file exists
  bool output_exists = false; //< output_path is set and the file exists
};

/**
 * @struct ResumeDecision
 * @brief Outcome of reconciling one record.
 */
struct ResumeDecision {
  FileState state;      //< State the record restarts from
  RequeueTarget target; //< Queue to push it to
  bool clear_local;     //< Drop local_path (and delete a partial copy)
  bool clear_output;    //< Drop output_path (and delete a stale output)
  bool clear_final;     //< Drop final_path (recomputed after encoding)
};

/**
 * @brief Decide how far back a persisted record has to be rewound.
 * @param loaded State read from the state file
 * @param artifacts Staging files found for the record
 */
ResumeDecision reconcile(FileState loaded, const ArtifactPresence &artifacts);

} // namespace net_stage

#endif // NET_STAGE_RESUME_HPP
