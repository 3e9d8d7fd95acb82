/**
 * @file main.cpp
 * @brief Entry point for the net_stage command-line tool
 *
 * @details Commands:
 *
 *          - run <file|dir>...: resume any persisted batch, register the
 *            given videos and run the pipeline
 *
 *          - resume: run the persisted batch only
 *
 *          - status [--all|--failed-only]: print the queue report
 *
 *          - clear: delete the staging directory and its state file
 *
 * @note Press 'q' (interactive terminal) or send SIGINT / SIGTERM to stop
 *       after the current files; run again or use `resume` to continue.
 *       The exit code of run/resume is the number of failed files.
 */

#include <algorithm>
#include <cctype>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <filesystem>
#include <string>
#include <vector>

#include "net_stage/cancellation.hpp"
#include "net_stage/config.hpp"
#include "net_stage/coordinator.hpp"
#include "net_stage/encode_executor.hpp"
#include "net_stage/logging.hpp"
#include "net_stage/queue_report.hpp"
#include "net_stage/types.hpp"

using namespace net_stage;

namespace fs = std::filesystem;

namespace {

CancellationToken *g_token = nullptr;

extern "C" void handle_signal(int) {
  if (g_token)
    g_token->request();
}

void print_usage() {
  LOG_WARN("Usage: ./net_stage run <file|dir>... | resume | "
           "status [--all|--failed-only] | clear");
}

bool is_video_file(const fs::path &path) {
  std::string ext = path.extension().string();
  std::transform(ext.begin(), ext.end(), ext.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return ext == ".mp4" || ext == ".mkv" || ext == ".ts" || ext == ".mov" ||
         ext == ".avi" || ext == ".m4v" || ext == ".wmv" || ext == ".flv" ||
         ext == ".webm";
}

/// Our own outputs are never fed back in
bool is_reencoded_output(const fs::path &path) {
  std::string stem = path.stem().string();
  std::string suffix = REENCODED_SUFFIX;
  return stem.size() >= suffix.size() &&
         stem.compare(stem.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::vector<std::string> collect_files(const std::vector<std::string> &args) {
  std::vector<std::string> files;

  for (const auto &arg : args) {
    std::error_code ec;
    if (fs::is_directory(arg, ec)) {
      std::vector<std::string> found;
      for (const auto &entry : fs::directory_iterator(arg, ec)) {
        if (entry.is_regular_file(ec) && is_video_file(entry.path()) &&
            !is_reencoded_output(entry.path())) {
          found.push_back(fs::absolute(entry.path()).string());
        }
      }
      if (ec) {
        LOG_ERROR("Cannot read directory {}: {}", arg, ec.message());
        continue;
      }
      std::sort(found.begin(), found.end());
      LOG_INFO("Found {} video files in {}", found.size(), arg);
      files.insert(files.end(), found.begin(), found.end());
    } else if (fs::is_regular_file(arg, ec)) {
      files.push_back(fs::absolute(arg).string());
    } else {
      LOG_WARN("Skipping {}: not a file or directory", arg);
    }
  }
  return files;
}

int run_pipeline(const std::vector<std::string> &inputs, bool resume_only) {
  CancellationToken token;
  g_token = &token;
  std::signal(SIGINT, handle_signal);
  std::signal(SIGTERM, handle_signal);

  PipelineCoordinator coordinator(PipelineOptions::from_env(), token);

  bool resumed = coordinator.load_state();
  if (resume_only && !resumed) {
    LOG_WARN("No saved batch found in {}", coordinator.staging().dir());
    return 0;
  }

  if (!resume_only) {
    std::vector<std::string> files = collect_files(inputs);
    if (files.empty() && !resumed) {
      LOG_WARN("No video files found");
      return 0;
    }
    coordinator.add_files(files);
  }

  ShutdownListener listener(token);
  if (listener.start()) {
    LOG_INFO("Press 'q' to stop after the current files");
  }

  std::string command = Config::encode_command();
  auto start_time = std::chrono::steady_clock::now();

  coordinator.start([&command](const std::string &input,
                               const std::string &output,
                               EncodeProgress *progress) {
    return execute_encode(input, output, command, progress);
  });

  if (token.requested()) {
    coordinator.stop();
    LOG_WARN("Stopped early; run `net_stage resume` to continue");
  }

  listener.stop();
  g_token = nullptr;

  double elapsed_sec = std::chrono::duration<double>(
                           std::chrono::steady_clock::now() - start_time)
                           .count();

  std::vector<FileRecord> records = coordinator.records();
  print_batch_summary(records, elapsed_sec);
  TimingCollector::print_summary();

  return static_cast<int>(
      std::count_if(records.begin(), records.end(), [](const FileRecord &r) {
        return r.state == FileState::Failed;
      }));
}

int show_status(const std::vector<std::string> &flags) {
  bool show_all = false;
  bool failed_only = false;
  for (const auto &flag : flags) {
    if (flag == "--all") {
      show_all = true;
    } else if (flag == "--failed-only") {
      failed_only = true;
    } else {
      print_usage();
      return 1;
    }
  }

  std::string error;
  QueueReport report = load_queue_report(Config::staging_dir(), error);

  fmt::print("\nState file: {}\n\n", report.state_file);

  if (!report.has_state) {
    if (!error.empty()) {
      LOG_ERROR("{}", error);
      return 1;
    }
    fmt::print(fg(fmt::color::yellow), "No queue state file found.\n\n");
    return 0;
  }

  if (failed_only) {
    print_failed_files(report);
  } else {
    print_queue_summary(report);
    print_failed_files(report);
    print_staging_info(report);
    print_detailed_status(report, show_all);
  }
  return 0;
}

int clear_staging() {
  CancellationToken token;
  PipelineCoordinator coordinator(PipelineOptions::from_env(), token);
  return coordinator.cleanup() ? 0 : 1;
}

} // anonymous namespace

// **---- MAIN ----**

int main(int argc, char *argv[]) {
  /// Disable stdout buffering for real-time log visibility
  std::setvbuf(stdout, nullptr, _IONBF, 0);

  if (argc < 2) {
    print_usage();
    return 1;
  }

  set_verbose(Config::verbose());

  std::string command = argv[1];
  std::vector<std::string> args(argv + 2, argv + argc);

  if (command == "run") {
    if (args.empty()) {
      print_usage();
      return 1;
    }
    return run_pipeline(args, false);
  }
  if (command == "resume")
    return run_pipeline({}, true);
  if (command == "status")
    return show_status(args);
  if (command == "clear")
    return clear_staging();

  print_usage();
  return 1;
}
