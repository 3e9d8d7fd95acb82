/**
 * @file coordinator.cpp
 * @brief Staging pipeline implementation
 *
 * @details Implements the PipelineCoordinator:
 *
 *          - Registry and the single transition function
 *
 *          - Download worker with backpressure
 *
 *          - Encode loop on the caller's thread
 *
 *          - Upload worker with the encode-finished latch
 *
 *          - Resume reconciliation, persistence and cleanup
 */

#include "net_stage/coordinator.hpp"

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <memory>
#include <system_error>
#include <unordered_set>

#include <fmt/core.h>

#include "net_stage/file_record.hpp"
#include "net_stage/logging.hpp"
#include "net_stage/resume.hpp"

namespace net_stage {

namespace fs = std::filesystem;

namespace {

std::string file_name(const std::string &path) {
  return fs::path(path).filename().string();
}

} // anonymous namespace

// **---- Construction ----**

PipelineCoordinator::PipelineCoordinator(PipelineOptions options,
                                         CancellationToken &token)
    : options_(std::move(options)), token_(token),
      staging_(options_.staging_dir),
      store_(staging_.path_for(STATE_FILE_NAME)),
      backpressure_(options_.max_buffer_size, options_.max_staging_bytes,
                    staging_,
                    [this] { return count_in_state(FileState::Local); }) {
  std::string error;
  if (!staging_.ensure(error)) {
    LOG_WARN("{}", error);
  }
}

PipelineCoordinator::~PipelineCoordinator() {
  /// Workers detached by stop() still run against this object
  if (active_workers() > 0)
    token_.request();
  await_worker(download_worker_);
  await_worker(upload_worker_);
}

// **---- Public API ----**

void PipelineCoordinator::add_files(const std::vector<std::string> &paths) {
  std::vector<std::string> to_queue;
  size_t added = 0;
  size_t retried = 0;

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    for (const auto &path : paths) {
      auto it = index_.find(path);
      if (it == index_.end()) {
        std::string final_path = compute_final_path(
            path, options_.output_extension, options_.replace_original);
        bool shared = std::any_of(
            records_.begin(), records_.end(), [&](const FileRecord &r) {
              return compute_final_path(r.source_path,
                                        options_.output_extension,
                                        options_.replace_original) ==
                     final_path;
            });
        if (shared) {
          LOG_WARN("{} shares its output path with another file, the later "
                   "upload wins: {}",
                   file_name(path), final_path);
        }

        FileRecord record;
        record.source_path = path;
        index_.emplace(path, records_.size());
        records_.push_back(std::move(record));
        to_queue.push_back(path);
        ++added;
        continue;
      }

      FileRecord &existing = records_[it->second];
      if (existing.state == FileState::Failed) {
        /// Explicit re-registration is the only retry path
        existing = FileRecord{};
        existing.source_path = path;
        to_queue.push_back(path);
        ++retried;
      } else if (existing.state == FileState::Complete) {
        LOG_DEBUG("Already complete, skipping: {}", file_name(path));
      } else {
        LOG_WARN("Already queued ({}), skipping: {}",
                 to_string(existing.state), file_name(path));
      }
    }
  }

  for (auto &key : to_queue)
    download_queue_.push(std::move(key));

  if (retried > 0) {
    LOG_INFO("Queued {} files ({} failed files re-queued)", added + retried,
             retried);
  } else {
    LOG_INFO("Queued {} files", added);
  }
  save_state();
}

void PipelineCoordinator::start(EncodeCallback encode,
                                EncodeProgress *progress) {
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    if (running_) {
      LOG_ERROR("Pipeline is already running");
      return;
    }
    running_ = true;
    encode_running_ = true;
  }

  encode_ = std::move(encode);
  progress_ = progress;
  encode_finished_.store(false);

  if (token_.requested()) {
    LOG_WARN("Cancellation already requested, no new work will be claimed");
  }

  LOG_PHASE("================== STAGING PIPELINE ==================");
  LOG_INFO("Staging directory: {}", staging_.dir());
  LOG_INFO("Buffer size: {} files", options_.max_buffer_size);
  if (options_.max_staging_bytes > 0) {
    LOG_INFO("Staging quota: {:.2f} GB",
             options_.max_staging_bytes / (1024.0 * 1024.0 * 1024.0));
  }
  LOG_PHASE("======================================================");

  /// A worker detached by an earlier stop() must exit before its slot is
  /// reused
  await_worker(download_worker_);
  await_worker(upload_worker_);

  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    download_worker_ =
        launch(&PipelineCoordinator::download_worker, "Download");
    upload_worker_ = launch(&PipelineCoordinator::upload_worker, "Upload");
  }

  /// Main thread handles encoding (CPU-bound, one file at a time)
  try {
    encode_loop();
  } catch (const std::exception &e) {
    LOG_ERROR("[Encode] Loop error: {}", e.what());
  }

  encode_finished_.store(true);
  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    encode_running_ = false;
  }
  lifecycle_cv_.notify_all();

  LOG_DEBUG("Encoding complete, waiting for uploads to finish...");

  /// Uploads queued right before the encode loop returned still drain
  await_worker(upload_worker_);
  await_worker(download_worker_);

  save_state();

  ProgressSnapshot p = get_progress();
  LOG_INFO("Pipeline finished: {} complete, {} failed, {} remaining",
           p.complete, p.failed, p.in_flight());

  {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    running_ = false;
  }
  lifecycle_cv_.notify_all();
}

void PipelineCoordinator::stop() {
  token_.request();
  LOG_INFO("Stopping pipeline, finishing current files...");

  {
    std::unique_lock<std::mutex> lock(lifecycle_mutex_);
    if (!lifecycle_cv_.wait_for(lock, options_.join_timeout,
                                [this] { return !encode_running_; })) {
      LOG_WARN("Encode loop still busy after {} ms, not waiting any longer",
               options_.join_timeout.count());
    }
  }

  join_worker(download_worker_, "Download");
  join_worker(upload_worker_, "Upload");

  save_state();
}

ProgressSnapshot PipelineCoordinator::get_progress() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return summarize(records_);
}

bool PipelineCoordinator::load_state() {
  if (running()) {
    LOG_ERROR("Cannot load state while the pipeline is running");
    return false;
  }

  std::string error;
  auto state = store_.load(error);
  if (!state) {
    if (!error.empty()) {
      LOG_ERROR("Failed to load state: {}", error);
    }
    return false;
  }

  std::vector<std::string> to_download;
  std::vector<std::string> to_encode;
  std::vector<std::string> to_upload;

  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    records_.clear();
    index_.clear();
    download_queue_.clear();
    encode_queue_.clear();
    upload_queue_.clear();

    /// Drop duplicates first so every kept record is known before cleanup
    std::vector<FileRecord> loaded_records;
    std::vector<ResumeDecision> decisions;
    std::unordered_set<std::string> seen;
    std::unordered_set<std::string> owned; //< staged copies that stay in use
    for (auto &record : state->files) {
      if (!seen.insert(record.source_path).second) {
        LOG_WARN("Duplicate entry in state file, keeping the first: {}",
                 record.source_path);
        continue;
      }

      ArtifactPresence artifacts;
      artifacts.local_exists =
          record.local_path && file_exists(*record.local_path);
      artifacts.output_exists =
          record.output_path && file_exists(*record.output_path);

      ResumeDecision decision = reconcile(record.state, artifacts);
      if (!decision.clear_local && record.local_path)
        owned.insert(*record.local_path);
      if (decision.clear_output && artifacts.output_exists)
        remove_file(*record.output_path);

      loaded_records.push_back(std::move(record));
      decisions.push_back(decision);
    }

    for (size_t i = 0; i < loaded_records.size(); ++i) {
      FileRecord &record = loaded_records[i];
      const ResumeDecision &decision = decisions[i];
      FileState loaded = record.state;

      if (loaded == FileState::Downloading) {
        /// The partial copy sits under one of the collision names; any of
        /// them no other record owns is stale
        for (size_t n = 0; n <= loaded_records.size(); ++n) {
          std::string candidate = staging_.path_for(
              download_name(record.source_path, static_cast<int>(n)));
          if (!owned.count(candidate) && file_exists(candidate))
            remove_file(candidate);
        }
      } else if (loaded == FileState::Encoding && record.local_path) {
        /// An interrupted encode leaves a truncated output behind
        remove_file(staging_.path_for(
            encoded_name(*record.local_path, options_.output_extension)));
      }
      if (decision.clear_local)
        record.local_path.reset();
      if (decision.clear_output)
        record.output_path.reset();
      if (decision.clear_final)
        record.final_path.reset();

      record.state = decision.state;
      if (record.state != FileState::Failed)
        record.error.reset();

      if (loaded != decision.state) {
        LOG_DEBUG("Resume: {} {} -> {}", file_name(record.source_path),
                  to_string(loaded), to_string(decision.state));
      }

      switch (decision.target) {
      case RequeueTarget::Download:
        to_download.push_back(record.source_path);
        break;
      case RequeueTarget::Encode:
        to_encode.push_back(record.source_path);
        break;
      case RequeueTarget::Upload:
        to_upload.push_back(record.source_path);
        break;
      case RequeueTarget::None:
        break;
      }

      index_.emplace(record.source_path, records_.size());
      records_.push_back(std::move(record));
    }
  }

  for (auto &key : to_download)
    download_queue_.push(std::move(key));
  for (auto &key : to_encode)
    encode_queue_.push(std::move(key));
  for (auto &key : to_upload)
    upload_queue_.push(std::move(key));

  ProgressSnapshot p = get_progress();
  LOG_INFO("Resumed from saved state: {} files ({} complete, {} failed, "
           "{} to download, {} to encode, {} to upload)",
           p.total, p.complete, p.failed, p.pending, p.local, p.uploading);

  save_state();
  return true;
}

void PipelineCoordinator::save_state() {
  std::lock_guard<std::mutex> persist_lock(persist_mutex_);
  std::vector<FileRecord> snapshot = records();

  std::string error;
  if (!store_.save(snapshot, error)) {
    LOG_ERROR("Failed to save state: {}", error);
  }
}

bool PipelineCoordinator::cleanup() {
  if (running()) {
    LOG_ERROR("Cannot clean up while the pipeline is running");
    return false;
  }

  {
    std::lock_guard<std::mutex> persist_lock(persist_mutex_);
    {
      std::lock_guard<std::mutex> lock(registry_mutex_);
      records_.clear();
      index_.clear();
    }
    download_queue_.clear();
    encode_queue_.clear();
    upload_queue_.clear();

    std::string error;
    if (!staging_.remove_all(error)) {
      LOG_ERROR("Cleanup failed: {}", error);
      return false;
    }
  }

  LOG_INFO("Cleaned up staging directory {}", staging_.dir());
  return true;
}

std::vector<FileRecord> PipelineCoordinator::records() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return records_;
}

std::optional<FileRecord>
PipelineCoordinator::find(const std::string &source_path) const {
  return snapshot_of(source_path);
}

bool PipelineCoordinator::running() const {
  std::lock_guard<std::mutex> lock(lifecycle_mutex_);
  return running_;
}

size_t PipelineCoordinator::active_workers() const {
  std::lock_guard<std::mutex> lock(workers_mutex_);
  size_t active = 0;
  for (const Worker *worker : {&download_worker_, &upload_worker_}) {
    if (worker->done.valid() &&
        worker->done.wait_for(std::chrono::seconds(0)) !=
            std::future_status::ready)
      ++active;
  }
  return active;
}

// **---- State Machine ----**

bool PipelineCoordinator::transition(const std::string &key, FileState to,
                                     const Mutator &mutate) {
  {
    std::lock_guard<std::mutex> lock(registry_mutex_);
    auto it = index_.find(key);
    if (it == index_.end()) {
      LOG_ERROR("Unknown record: {}", key);
      return false;
    }

    FileRecord &record = records_[it->second];
    if (!can_transition(record.state, to)) {
      LOG_ERROR("Invalid transition {} -> {} for {}", to_string(record.state),
                to_string(to), file_name(key));
      return false;
    }

    if (mutate)
      mutate(record);
    record.state = to;
    if (to != FileState::Failed)
      record.error.reset();
  }

  save_state();
  return true;
}

void PipelineCoordinator::fail(const std::string &key,
                               const std::string &message) {
  LOG_ERROR("{}: {}", file_name(key), message);
  transition(key, FileState::Failed, [&message](FileRecord &record) {
    record.error = message;
    record.local_path.reset();
  });
}

std::optional<FileRecord>
PipelineCoordinator::snapshot_of(const std::string &key) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  auto it = index_.find(key);
  if (it == index_.end())
    return std::nullopt;
  return records_[it->second];
}

size_t PipelineCoordinator::count_in_state(FileState state) const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return static_cast<size_t>(
      std::count_if(records_.begin(), records_.end(),
                    [state](const FileRecord &r) { return r.state == state; }));
}

size_t PipelineCoordinator::count_staged() const {
  std::lock_guard<std::mutex> lock(registry_mutex_);
  return static_cast<size_t>(std::count_if(
      records_.begin(), records_.end(), [](const FileRecord &r) {
        return r.state == FileState::Local ||
               r.state == FileState::Encoding ||
               r.state == FileState::Uploading;
      }));
}

bool PipelineCoordinator::upstream_drained() const {
  if (!download_queue_.empty())
    return false;

  std::lock_guard<std::mutex> lock(registry_mutex_);
  return std::none_of(records_.begin(), records_.end(),
                      [](const FileRecord &r) {
                        return r.state == FileState::Pending ||
                               r.state == FileState::Downloading ||
                               r.state == FileState::Local;
                      });
}

std::string
PipelineCoordinator::download_path_locked(const std::string &source) const {
  for (int n = 0;; ++n) {
    std::string candidate = staging_.path_for(download_name(source, n));
    bool taken = std::any_of(records_.begin(), records_.end(),
                             [&](const FileRecord &r) {
                               return r.source_path != source &&
                                      r.local_path == candidate;
                             });
    if (!taken)
      return candidate;
  }
}

// **---- Download Stage ----**

void PipelineCoordinator::download_worker() {
  int downloaded = 0;
  LOG_INFO("[Download] Started");

  while (!token_.requested()) {
    PauseReason reason = backpressure_.check();
    if (reason == PauseReason::BufferFull ||
        (reason == PauseReason::QuotaReached && count_staged() > 0)) {
      /// Re-checks cancellation on every wake
      token_.sleep_for(options_.pause_interval);
      continue;
    }
    /// A quota hit with nothing staged cannot clear by itself, admit one

    std::string key;
    if (!download_queue_.pop_for(key, options_.poll_interval)) {
      if (encode_finished_.load())
        break;
      continue;
    }

    try {
      if (process_download(key))
        ++downloaded;
    } catch (const std::exception &e) {
      fail(key, fmt::format("Download failed: {}", e.what()));
    }
  }

  LOG_INFO("[Download] Finished ({} files)", downloaded);
}

bool PipelineCoordinator::process_download(const std::string &key) {
  std::string local_path;
  if (!transition(key, FileState::Downloading,
                  [this, &local_path](FileRecord &record) {
                    local_path = download_path_locked(record.source_path);
                  })) {
    return false;
  }

  LOG_INFO("[Download] {}", file_name(key));

  std::string error;
  if (!staging_.ensure(error)) {
    fail(key, fmt::format("Download failed: {}", error));
    return false;
  }

  TIMER_START(download);
  bool copied = copy_file_preserving(key, local_path, error);
  TIMER_END(download);

  if (!copied) {
    remove_file(local_path);
    fail(key, fmt::format("Download failed: {}", error));
    return false;
  }

  if (!transition(key, FileState::Local,
                  [&local_path](FileRecord &record) {
                    record.local_path = local_path;
                  })) {
    remove_file(local_path);
    return false;
  }

  encode_queue_.push(key);
  LOG_DEBUG("[Download] Done: {}", file_name(key));
  return true;
}

// **---- Encode Stage ----**

void PipelineCoordinator::encode_loop() {
  int encoded = 0;
  LOG_INFO("[Encode] Started");

  while (!token_.requested()) {
    std::string key;
    if (!encode_queue_.pop_for(key, options_.poll_interval)) {
      /// Done once nothing can reach the encoder any more
      if (upstream_drained())
        break;
      continue;
    }

    if (process_encode(key))
      ++encoded;
  }

  LOG_INFO("[Encode] Finished ({} files)", encoded);
}

bool PipelineCoordinator::process_encode(const std::string &key) {
  auto record = snapshot_of(key);
  if (!record || !transition(key, FileState::Encoding))
    return false;

  std::string local_input = record->local_path.value_or("");
  if (local_input.empty() || !file_exists(local_input)) {
    fail(key, "Encoding failed: local input missing");
    return false;
  }

  std::string error;
  if (!staging_.ensure(error)) {
    remove_file(local_input);
    fail(key, fmt::format("Encoding failed: {}", error));
    return false;
  }

  std::string local_output = staging_.path_for(
      encoded_name(local_input, options_.output_extension));

  LOG_INFO("[Encode] {}", file_name(key));

  bool success = false;
  std::string failure = "Encoding failed or output missing";

  TIMER_START(encode);
  try {
    success = encode_ && encode_(local_input, local_output, progress_);
  } catch (const std::exception &e) {
    failure = fmt::format("Encoding error: {}", e.what());
  }
  TIMER_END(encode);

  if (!success || !file_exists(local_output)) {
    /// Keep the staging area from leaking
    remove_file(local_input);
    remove_file(local_output);
    fail(key, failure);
    return false;
  }

  std::string final_path = compute_final_path(
      key, options_.output_extension, options_.replace_original);

  /// Local input is no longer needed
  remove_file(local_input);

  if (!transition(key, FileState::Uploading,
                  [&](FileRecord &r) {
                    r.output_path = local_output;
                    r.final_path = final_path;
                  })) {
    return false;
  }

  upload_queue_.push(key);
  LOG_DEBUG("[Encode] Done: {}", file_name(key));
  return true;
}

// **---- Upload Stage ----**

void PipelineCoordinator::upload_worker() {
  int uploaded = 0;
  LOG_INFO("[Upload] Started");

  while (!token_.requested()) {
    std::string key;
    if (!upload_queue_.pop_for(key, options_.poll_interval)) {
      /// An empty queue means nothing until the encode loop has exited
      if (encode_finished_.load() && upload_queue_.empty())
        break;
      continue;
    }

    try {
      if (process_upload(key))
        ++uploaded;
    } catch (const std::exception &e) {
      fail(key, fmt::format("Upload failed: {}", e.what()));
    }
  }

  LOG_INFO("[Upload] Finished ({} files)", uploaded);
}

bool PipelineCoordinator::process_upload(const std::string &key) {
  auto record = snapshot_of(key);
  if (!record || record->state != FileState::Uploading) {
    LOG_WARN("[Upload] Skipping {}: not ready for upload", file_name(key));
    return false;
  }

  std::string output = record->output_path.value_or("");
  std::string final_path = record->final_path.value_or(compute_final_path(
      key, options_.output_extension, options_.replace_original));

  /// Output may have been lost to an external cleanup
  if (output.empty() || !file_exists(output)) {
    fail(key, "Upload failed: encoded output missing");
    return false;
  }

  LOG_INFO("[Upload] {} -> {}", file_name(output), file_name(final_path));

  std::error_code ec;
  fs::path parent = fs::path(final_path).parent_path();
  if (!parent.empty())
    fs::create_directories(parent, ec);
  if (ec) {
    fail(key, fmt::format("Upload failed: {}", ec.message()));
    return false;
  }

  std::string error;
  TIMER_START(upload);
  bool copied = copy_file_preserving(output, final_path, error);
  TIMER_END(upload);
  if (!copied) {
    fail(key, fmt::format("Upload failed: {}", error));
    return false;
  }

  if (options_.replace_original) {
    fs::path source(key);
    if (source.lexically_normal() != fs::path(final_path).lexically_normal() &&
        file_exists(key)) {
      if (remove_file(key)) {
        LOG_DEBUG("[Upload] Deleted original: {}", file_name(key));
      }
    }
  }

  remove_file(output);

  if (!transition(key, FileState::Complete,
                  [&final_path](FileRecord &r) {
                    r.local_path.reset();
                    r.final_path = final_path;
                  })) {
    return false;
  }

  LOG_SUCCESS("Uploaded: {}", file_name(final_path));
  return true;
}

// **---- Worker Lifecycle ----**

PipelineCoordinator::Worker
PipelineCoordinator::launch(void (PipelineCoordinator::*body)(),
                            const char *name) {
  auto finished = std::make_shared<std::promise<void>>();
  Worker worker;
  worker.done = finished->get_future().share();
  worker.thread = std::thread([this, body, name, finished]() {
    try {
      (this->*body)();
    } catch (const std::exception &e) {
      LOG_ERROR("[{}] Worker error: {}", name, e.what());
    }
    finished->set_value();
  });
  return worker;
}

void PipelineCoordinator::await_worker(Worker &worker) {
  std::shared_future<void> done;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    done = worker.done;
  }

  /// Also covers a detached thread, whose future outlives the handle
  if (done.valid())
    done.wait();

  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (worker.thread.joinable())
    worker.thread.join();
}

bool PipelineCoordinator::join_worker(Worker &worker, const char *name) {
  std::shared_future<void> done;
  {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    if (!worker.thread.joinable())
      return true;
    done = worker.done;
  }

  bool finished =
      done.wait_for(options_.join_timeout) == std::future_status::ready;

  std::lock_guard<std::mutex> lock(workers_mutex_);
  if (!worker.thread.joinable())
    return finished;

  if (!finished) {
    LOG_WARN("[{}] Worker did not stop within {} ms, detaching it", name,
             options_.join_timeout.count());
    worker.thread.detach();
    return false;
  }

  worker.thread.join();
  return true;
}

} // namespace net_stage
