/**
 * @file file_record.cpp
 * @brief FileRecord state machine rules and naming implementation
 */

#include "net_stage/file_record.hpp"

#include <filesystem>

#include <fmt/core.h>

namespace net_stage {

namespace fs = std::filesystem;

bool operator==(const FileRecord &a, const FileRecord &b) {
  return a.source_path == b.source_path && a.local_path == b.local_path &&
         a.output_path == b.output_path && a.final_path == b.final_path &&
         a.state == b.state && a.error == b.error;
}

// **---- State Names ----**

const char *to_string(FileState state) {
  switch (state) {
  case FileState::Pending:
    return "pending";
  case FileState::Downloading:
    return "downloading";
  case FileState::Local:
    return "local";
  case FileState::Encoding:
    return "encoding";
  case FileState::Uploading:
    return "uploading";
  case FileState::Complete:
    return "complete";
  case FileState::Failed:
    return "failed";
  }
  return "unknown";
}

std::optional<FileState> parse_file_state(const std::string &name) {
  static const FileState all[] = {
      FileState::Pending,   FileState::Downloading, FileState::Local,
      FileState::Encoding,  FileState::Uploading,   FileState::Complete,
      FileState::Failed};
  for (FileState s : all) {
    if (name == to_string(s))
      return s;
  }
  return std::nullopt;
}

bool is_terminal(FileState state) {
  return state == FileState::Complete || state == FileState::Failed;
}

// **---- Transitions ----**

bool can_transition(FileState from, FileState to) {
  if (is_terminal(from))
    return false;
  if (to == FileState::Failed)
    return true;

  switch (from) {
  case FileState::Pending:
    return to == FileState::Downloading;
  case FileState::Downloading:
    return to == FileState::Local;
  case FileState::Local:
    return to == FileState::Encoding;
  case FileState::Encoding:
    return to == FileState::Uploading;
  case FileState::Uploading:
    return to == FileState::Complete;
  default:
    return false;
  }
}

ProgressSnapshot summarize(const std::vector<FileRecord> &records) {
  ProgressSnapshot p;
  p.total = records.size();
  for (const auto &record : records) {
    switch (record.state) {
    case FileState::Pending:
      p.pending++;
      break;
    case FileState::Downloading:
      p.downloading++;
      break;
    case FileState::Local:
      p.local++;
      break;
    case FileState::Encoding:
      p.encoding++;
      break;
    case FileState::Uploading:
      p.uploading++;
      break;
    case FileState::Complete:
      p.complete++;
      break;
    case FileState::Failed:
      p.failed++;
      break;
    }
  }
  return p;
}

// **---- Naming ----**

std::string download_name(const std::string &source_path,
                          int collision_index) {
  fs::path source(source_path);
  if (collision_index <= 0)
    return DOWNLOAD_PREFIX + source.filename().string();

  return fmt::format("{}{}_{}{}", DOWNLOAD_PREFIX, source.stem().string(),
                     collision_index, source.extension().string());
}

std::string encoded_name(const std::string &local_path,
                         const std::string &output_extension) {
  /// Full name: clip.mkv and clip.avi must not share an output
  return ENCODED_PREFIX + fs::path(local_path).filename().string() +
         output_extension;
}

std::string compute_final_path(const std::string &source_path,
                               const std::string &output_extension,
                               bool replace_original) {
  fs::path source(source_path);
  if (replace_original)
    return fs::path(source).replace_extension(output_extension).string();

  return (source.parent_path() /
          (source.stem().string() + REENCODED_SUFFIX + output_extension))
      .string();
}

} // namespace net_stage
