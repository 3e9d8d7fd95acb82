/**
 * @file coordinator.hpp
 * @brief Resumable download -> encode -> upload staging pipeline
 *
 * @details The PipelineCoordinator moves files that live on slow or
 *          unreliable remote storage through a local staging directory:
 *
 *          1. Download worker copies PENDING sources into staging (LOCAL)
 *
 *          2. Encode loop runs the injected encode callback on the caller's
 *             thread (LOCAL -> ENCODING -> UPLOADING)
 *
 *          3. Upload worker copies results to their final path (COMPLETE)
 *
 *          Every state change goes through one transition function that
 *          validates it, applies it under the registry lock and persists the
 *          whole registry, so a process killed at any point can resume with
 *          load_state().
 *
 * @note Three execution units, intentionally asymmetric: downloads and
 *       uploads are I/O-bound and get a thread each; encoding is CPU-bound
 *       and runs one file at a time on the thread that calls start().
 */

#ifndef NET_STAGE_COORDINATOR_HPP
#define NET_STAGE_COORDINATOR_HPP

#include <atomic>
#include <condition_variable>
#include <functional>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "backpressure.hpp"
#include "cancellation.hpp"
#include "config.hpp"
#include "stage_queue.hpp"
#include "staging_area.hpp"
#include "state_store.hpp"
#include "types.hpp"

namespace net_stage {

/**
 * @brief Encode callback supplied by the caller.
 *
 * @param input Local copy of the source in the staging directory
 * @param output Path the encoded file must be written to
 * @param progress Opaque handle passed through from start() (may be null)
 * @return true on success; the output file must then exist
 *
 * @note May throw; an exception counts as a failed encode.
 */
using EncodeCallback = std::function<bool(
    const std::string &input, const std::string &output,
    EncodeProgress *progress)>;

/**
 * @class PipelineCoordinator
 * @brief Owns the FileRecords, the three stage queues and the workers.
 *
 * @attention LOCKING:
 *
 *   - registry_mutex_ guards every FileRecord and every progress snapshot
 *
 *   - the stage queues are synchronized internally
 *
 *   - persist_mutex_ serializes state file writes; it is always taken before
 *     registry_mutex_, never after
 *
 * @attention CANCELLATION:
 *
 *   - The token is polled at stage-loop boundaries only. A copy or encode in
 *     progress always finishes and its transition is persisted.
 */
class PipelineCoordinator {
public:
  /**
   * @param options Staging directory, limits and timing
   * @param token Cancellation token shared with the caller (must outlive
   *              the coordinator)
   */
  PipelineCoordinator(PipelineOptions options, CancellationToken &token);

  /// Raises the token if a worker is still running and waits for it to exit,
  /// including one stop() detached.
  ~PipelineCoordinator();

  /// Disable copy
  PipelineCoordinator(const PipelineCoordinator &) = delete;
  PipelineCoordinator &operator=(const PipelineCoordinator &) = delete;

  /**
   * @brief Register source files as PENDING and queue them for download.
   *
   * @note One record per source path. Re-adding a FAILED source resets it to
   *       PENDING (the only way to retry it); COMPLETE and in-flight sources
   *       are left alone.
   */
  void add_files(const std::vector<std::string> &paths);

  /**
   * @brief Run the pipeline until the batch has drained.
   *
   * @details Launches the download and upload workers, runs the encode loop
   *          on the calling thread, then waits for every upload the encode
   *          loop queued. Returns early (with work left for a later resume)
   *          when the cancellation token is raised.
   *
   * @param encode Encode callback
   * @param progress Opaque handle forwarded to every encode call
   */
  void start(EncodeCallback encode, EncodeProgress *progress = nullptr);

  /**
   * @brief Raise cancellation, wait for the stages, persist final state.
   *
   * @note Each stage gets options.join_timeout to finish its current file;
   *       a worker that does not exit in time is detached and logged, and is
   *       awaited again by the next start() or the destructor. Completed
   *       stages are not rolled back.
   */
  void stop();

  /**
   * @brief Per-state counts (thread-safe).
   */
  ProgressSnapshot get_progress() const;

  /**
   * @brief Replace the registry with the persisted batch.
   *
   * @details Each record is reconciled against the staging files that still
   *          exist (see resume.hpp) and pushed to the queue of the stage it
   *          resumes from. COMPLETE and FAILED records are kept, not queued.
   *
   * @return true if a state file was found and loaded
   */
  bool load_state();

  /**
   * @brief Persist the registry now (best-effort; failures are logged).
   */
  void save_state();

  /**
   * @brief Discard the batch: registry, queues, staging directory and state
   *        file. Irreversible.
   * @return true on success; refused while the pipeline runs
   */
  bool cleanup();

  /**
   * @brief Copy of every record, in registration order.
   */
  std::vector<FileRecord> records() const;

  /**
   * @brief Copy of one record.
   */
  std::optional<FileRecord> find(const std::string &source_path) const;

  const PipelineOptions &options() const { return options_; }
  const std::string &state_file() const { return store_.path(); }
  const StagingArea &staging() const { return staging_; }

  /// Whether start() is currently executing.
  bool running() const;

  /// Stage threads that have not exited yet, detached ones included.
  size_t active_workers() const;

private:
  /**
   * @struct Worker
   * @brief A stage thread plus a future that becomes ready when it exits.
   */
  struct Worker {
    std::thread thread;
    std::shared_future<void> done;
  };

  using Mutator = std::function<void(FileRecord &)>;

  PipelineOptions options_;
  CancellationToken &token_;
  StagingArea staging_;
  StateStore store_;
  BackpressureController backpressure_;

  /// Registry
  mutable std::mutex registry_mutex_;
  std::vector<FileRecord> records_;
  std::unordered_map<std::string, size_t> index_; //< source_path -> slot

  /// Stage queues
  StageQueue download_queue_;
  StageQueue encode_queue_;
  StageQueue upload_queue_;

  std::mutex persist_mutex_;

  /// Stage threads
  mutable std::mutex workers_mutex_;
  Worker download_worker_;
  Worker upload_worker_;

  /// start() / stop() handshake
  mutable std::mutex lifecycle_mutex_;
  std::condition_variable lifecycle_cv_;
  bool running_ = false;
  bool encode_running_ = false;

  /// Latch: set when the encode loop exits, no upload will be queued after
  std::atomic<bool> encode_finished_{false};

  EncodeCallback encode_;
  EncodeProgress *progress_ = nullptr;

  // **---- State Machine ----**

  /**
   * @brief Validate and apply a transition, then persist.
   * @param mutate Optional path updates applied under the same lock
   * @return false for an unknown key or a disallowed transition
   */
  bool transition(const std::string &key, FileState to,
                  const Mutator &mutate = nullptr);

  /**
   * @brief Transition to FAILED with a message; drops the local path.
   */
  void fail(const std::string &key, const std::string &message);

  std::optional<FileRecord> snapshot_of(const std::string &key) const;
  size_t count_in_state(FileState state) const;

  /// Records holding files in staging (LOCAL, ENCODING, UPLOADING)
  size_t count_staged() const;

  /// Download queue empty and no record waiting to reach the encoder
  bool upstream_drained() const;

  /// Collision-free staging path for a download (registry lock held)
  std::string download_path_locked(const std::string &source) const;

  // **---- Stages ----**

  void download_worker();
  void encode_loop();
  void upload_worker();

  bool process_download(const std::string &key);
  bool process_encode(const std::string &key);
  bool process_upload(const std::string &key);

  // **---- Worker Lifecycle ----**

  Worker launch(void (PipelineCoordinator::*body)(), const char *name);

  /// Wait without limit for a worker to exit, then join it if still attached.
  void await_worker(Worker &worker);

  /// Wait up to options_.join_timeout, then join or detach the worker.
  bool join_worker(Worker &worker, const char *name);
};

} // namespace net_stage

#endif // NET_STAGE_COORDINATOR_HPP
