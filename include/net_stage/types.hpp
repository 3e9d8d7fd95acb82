/**
 * @file types.hpp
 * @brief Core data types and constants for Net Stage
 *
 * @details Contains fundamental data structures used throughout the
 * application:
 *          - Staging-area naming constants
 *
 *          - FileState for the per-file pipeline state machine
 *
 *          - FileRecord for per-file path bookkeeping
 *
 *          - ProgressSnapshot for per-state counts
 */

#ifndef NET_STAGE_TYPES_HPP
#define NET_STAGE_TYPES_HPP

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace net_stage {

// **----- CONSTANTS -----**

/// Name of the persisted state file inside the staging directory
constexpr const char *STATE_FILE_NAME = "queue_state.json";

/// Prefix of downloaded copies in the staging directory
constexpr const char *DOWNLOAD_PREFIX = "download_";

/// Prefix of encoded outputs in the staging directory
constexpr const char *ENCODED_PREFIX = "encoded_";

/// Suffix appended to the stem of the final file when originals are kept
constexpr const char *REENCODED_SUFFIX = "_reencoded";

// **----- DATA STRUCTURES -----**

/**
 * @enum FileState
 * @brief Position of a file in the download -> encode -> upload pipeline.
 * @note COMPLETE and FAILED are terminal.
 */
enum class FileState {
  Pending,     //< Waiting to be downloaded
  Downloading, //< Being copied into the staging area
  Local,       //< Downloaded, waiting for the encode loop
  Encoding,    //< Encode callback running
  Uploading,   //< Encoded, waiting for or being copied to its final path
  Complete,    //< Uploaded and cleaned up
  Failed       //< Error recorded on the record
};

/// Number of FileState values
constexpr size_t FILE_STATE_COUNT = 7;

/**
 * @struct FileRecord
 * @brief Tracks one source file through the pipeline.
 * @note source_path is the identity key and never changes after creation.
 */
struct FileRecord {
  std::string source_path;                //< Original (remote) location
  std::optional<std::string> local_path;  //< Downloaded copy in staging
  std::optional<std::string> output_path; //< Encoded result in staging
  std::optional<std::string> final_path;  //< Upload destination
  FileState state = FileState::Pending;
  std::optional<std::string> error; //< Set only when state == Failed
};

bool operator==(const FileRecord &a, const FileRecord &b);
inline bool operator!=(const FileRecord &a, const FileRecord &b) {
  return !(a == b);
}

/**
 * @struct ProgressSnapshot
 * @brief Per-state record counts taken under the registry lock.
 */
struct ProgressSnapshot {
  size_t total = 0;
  size_t pending = 0;
  size_t downloading = 0;
  size_t local = 0;
  size_t encoding = 0;
  size_t uploading = 0;
  size_t complete = 0;
  size_t failed = 0;

  /// Records that have not reached a terminal state
  size_t in_flight() const { return total - complete - failed; }
};

/**
 * @struct EncodeProgress
 * @brief Opaque progress handle handed to the encode callback.
 * @note The pipeline never reads it; the callback and the caller share it.
 */
struct EncodeProgress {
  std::atomic<double> fraction{0.0}; //< 0.0 .. 1.0
  std::atomic<int64_t> frames{0};
};

} // namespace net_stage

#endif // NET_STAGE_TYPES_HPP
