/**
 * @file queue_report.cpp
 * @brief Queue status report implementation
 */

#include "net_stage/queue_report.hpp"

#include <cctype>
#include <cstdio>
#include <ctime>
#include <filesystem>

#include <fmt/color.h>
#include <fmt/core.h>

#include "net_stage/file_record.hpp"
#include "net_stage/state_store.hpp"

namespace net_stage {

namespace fs = std::filesystem;

namespace {

constexpr size_t MAX_LISTED_STAGING_FILES = 10;

const char *RULE =
    "======================================================================\n";

void print_header(const char *title) {
  fmt::print(fg(fmt::color::cyan), "{}", RULE);
  fmt::print(fg(fmt::color::cyan), "{}\n", title);
  fmt::print(fg(fmt::color::cyan), "{}", RULE);
}

fmt::text_style state_style(FileState state) {
  switch (state) {
  case FileState::Complete:
    return fg(fmt::color::green);
  case FileState::Failed:
    return fg(fmt::color::red);
  case FileState::Local:
  case FileState::Encoding:
  case FileState::Uploading:
    return fg(fmt::color::yellow);
  default:
    return fg(fmt::color::cyan);
  }
}

std::string upper(const char *s) {
  std::string out(s);
  for (auto &c : out)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
  return out;
}

std::string file_name(const std::string &path) {
  return fs::path(path).filename().string();
}

} // anonymous namespace

QueueReport load_queue_report(const std::string &staging_dir,
                              std::string &error) {
  QueueReport report;
  StagingArea staging(staging_dir);
  StateStore store(staging.path_for(STATE_FILE_NAME));

  report.staging_dir = staging.dir();
  report.state_file = store.path();

  auto state = store.load(error);
  if (state) {
    report.has_state = true;
    report.files = std::move(state->files);
    report.timestamp = state->timestamp;
  }

  report.staging_exists = staging.exists();
  if (report.staging_exists) {
    report.staging_files = staging.entries();
    for (const auto &entry : report.staging_files)
      report.staging_bytes += entry.size;
  }
  return report;
}

std::string format_size(uint64_t bytes) {
  const char *units[] = {"B", "KB", "MB", "GB"};
  double value = static_cast<double>(bytes);
  for (const char *unit : units) {
    if (value < 1024.0)
      return fmt::format("{:.2f} {}", value, unit);
    value /= 1024.0;
  }
  return fmt::format("{:.2f} TB", value);
}

// **---- Printing ----**

void print_queue_summary(const QueueReport &report) {
  ProgressSnapshot p = summarize(report.files);

  print_header("QUEUE SUMMARY");
  fmt::print("Total files: {}\n", p.total);
  if (report.timestamp > 0) {
    std::time_t saved = static_cast<std::time_t>(report.timestamp);
    char buf[32];
    if (std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S",
                      std::localtime(&saved))) {
      fmt::print("Last update: {}\n", buf);
    }
  }
  fmt::print("\n");

  auto row = [](const char *label, size_t count, fmt::text_style style) {
    if (count > 0)
      fmt::print("  {:<19}{}\n", label, fmt::styled(count, style));
  };
  row("Pending download:", p.pending, fg(fmt::color::cyan));
  row("Downloading:", p.downloading, fg(fmt::color::cyan));
  row("Ready to encode:", p.local, fg(fmt::color::yellow));
  row("Encoding:", p.encoding, fg(fmt::color::yellow));
  row("Uploading:", p.uploading, fg(fmt::color::yellow));
  row("Complete:", p.complete, fg(fmt::color::green));
  row("Failed:", p.failed, fg(fmt::color::red));
  fmt::print("\n");

  if (p.total > 0) {
    double complete_pct = 100.0 * p.complete / p.total;
    double failed_pct = 100.0 * p.failed / p.total;
    fmt::print("Progress: {:.1f}% complete, {:.1f}% failed, {:.1f}% in "
               "progress\n\n",
               complete_pct, failed_pct, 100.0 - complete_pct - failed_pct);
  }
  std::fflush(stdout);
}

void print_failed_files(const QueueReport &report) {
  int idx = 0;
  for (const auto &record : report.files) {
    if (record.state != FileState::Failed)
      continue;
    if (idx == 0) {
      print_header("FAILED FILES");
      fmt::print("\n");
    }
    fmt::print("{}. {} {}\n", ++idx, fmt::styled("x", fg(fmt::color::red)),
               file_name(record.source_path));
    fmt::print("   Error: {}\n\n", record.error.value_or("Unknown error"));
  }
  std::fflush(stdout);
}

void print_staging_info(const QueueReport &report) {
  print_header("STAGING DIRECTORY");
  fmt::print("Location: {}\n\n", report.staging_dir);

  if (!report.staging_exists) {
    fmt::print(fg(fmt::color::yellow),
               "Directory does not exist (batch not started or already "
               "cleared)\n\n");
    std::fflush(stdout);
    return;
  }

  fmt::print("Total size: {}\n", format_size(report.staging_bytes));
  fmt::print("File count: {}\n\n", report.staging_files.size());

  if (!report.staging_files.empty()) {
    fmt::print("Files:\n");
    size_t shown = 0;
    for (const auto &entry : report.staging_files) {
      if (shown++ == MAX_LISTED_STAGING_FILES)
        break;
      fmt::print("  - {} ({})\n", entry.name, format_size(entry.size));
    }
    if (report.staging_files.size() > MAX_LISTED_STAGING_FILES) {
      fmt::print("  ... and {} more files\n",
                 report.staging_files.size() - MAX_LISTED_STAGING_FILES);
    }
    fmt::print("\n");
  }
  std::fflush(stdout);
}

void print_detailed_status(const QueueReport &report, bool show_all) {
  std::vector<const FileRecord *> shown;
  for (const auto &record : report.files) {
    if (show_all || record.state != FileState::Complete)
      shown.push_back(&record);
  }

  if (shown.empty()) {
    print_header("No files to show (all complete)");
    std::fflush(stdout);
    return;
  }

  print_header(show_all ? "DETAILED STATUS (ALL FILES)"
                        : "DETAILED STATUS (IN PROGRESS + FAILED)");
  fmt::print("\n");

  int idx = 0;
  for (const FileRecord *record : shown) {
    fmt::print("{}. {}\n", ++idx, file_name(record->source_path));
    fmt::print("   Status: {}\n",
               fmt::styled(upper(to_string(record->state)),
                           state_style(record->state)));
    if (record->state == FileState::Failed && record->error) {
      fmt::print("   Error: {}\n", fmt::styled(*record->error,
                                               fg(fmt::color::red)));
    }
    fmt::print("\n");
  }
  std::fflush(stdout);
}

void print_batch_summary(const std::vector<FileRecord> &records,
                         double wall_clock_sec) {
  ProgressSnapshot p = summarize(records);

  fmt::print("\n");
  fmt::print(fg(fmt::color::cyan),
             "============== STAGING PIPELINE SUMMARY ==============\n");
  fmt::print("{:<25} {:>25}\n", "Total files:", p.total);
  fmt::print("{:<25} {:>25}\n", "Complete:", p.complete);
  fmt::print("{:<25} {:>25}\n", "Failed:", p.failed);
  fmt::print("{:<25} {:>25}\n", "Remaining:", p.in_flight());
  fmt::print("{:<25} {:>22.1f}s\n", "Wall-clock time:", wall_clock_sec);

  if (p.complete > 0) {
    fmt::print("{:<25} {:>22.1f}s\n", "Average time per file:",
               wall_clock_sec / p.complete);
  }

  fmt::print(fg(fmt::color::cyan),
             "======================================================\n");
  std::fflush(stdout);

  if (p.failed > 0) {
    fmt::print(fg(fmt::color::red), "\nFailed files:\n");
    for (const auto &record : records) {
      if (record.state == FileState::Failed) {
        fmt::print(fg(fmt::color::red), "  - {}: {}\n",
                   file_name(record.source_path),
                   record.error.value_or("unknown error"));
      }
    }
    std::fflush(stdout);
  }
}

} // namespace net_stage
