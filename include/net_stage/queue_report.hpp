/**
 * @file queue_report.hpp
 * @brief Read-only status report of a staging batch
 *
 * @details Built from the state file and the staging directory, without a
 *          running coordinator, so it can be printed while another process
 *          works the batch:
 *
 *          - Per-state counts and completion percentage
 *
 *          - Failed files with their error messages
 *
 *          - Staging directory size and contents
 *
 *          - Per-file status listing
 */

#ifndef NET_STAGE_QUEUE_REPORT_HPP
#define NET_STAGE_QUEUE_REPORT_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "staging_area.hpp"
#include "types.hpp"

namespace net_stage {

/**
 * @struct QueueReport
 * @brief Snapshot of a batch as seen on disk.
 */
struct QueueReport {
  std::string state_file;
  std::string staging_dir;

  bool has_state = false; //< State file present and parsed
  std::vector<FileRecord> files;
  double timestamp = 0.0; //< Time of the last save

  bool staging_exists = false;
  std::vector<StagingEntry> staging_files; //< Largest first
  uint64_t staging_bytes = 0;
};

/**
 * @brief Read the state file and list the staging directory.
 *
 * @param staging_dir Staging directory holding the state file
 * @param error Output: description if the state file exists but is unreadable
 * @return The report; has_state is false when there is nothing to show
 */
QueueReport load_queue_report(const std::string &staging_dir,
                              std::string &error);

/**
 * @brief Human readable byte count ("1.50 GB").
 */
std::string format_size(uint64_t bytes);

// **---- Printing ----**

void print_queue_summary(const QueueReport &report);
void print_failed_files(const QueueReport &report);
void print_staging_info(const QueueReport &report);

/**
 * @brief One entry per file.
 * @param show_all Include COMPLETE records (hidden by default)
 */
void print_detailed_status(const QueueReport &report, bool show_all);

/**
 * @brief End-of-run summary of a batch.
 * @param records Final records of the run
 * @param wall_clock_sec Duration of the run
 */
void print_batch_summary(const std::vector<FileRecord> &records,
                         double wall_clock_sec);

} // namespace net_stage

#endif // NET_STAGE_QUEUE_REPORT_HPP
