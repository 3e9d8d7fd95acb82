/**
 * @file staging_area.cpp
 * @brief Staging directory and file transfer helpers implementation
 */

#include "net_stage/staging_area.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>

#include "net_stage/logging.hpp"

namespace net_stage {

namespace fs = std::filesystem;

// **---- StagingArea ----**

StagingArea::StagingArea(std::string dir) : dir_(std::move(dir)) {}

std::string StagingArea::path_for(const std::string &name) const {
  return (fs::path(dir_) / name).string();
}

bool StagingArea::ensure(std::string &error) const {
  std::error_code ec;
  if (fs::is_directory(dir_, ec))
    return true;

  fs::create_directories(dir_, ec);
  if (ec || !fs::is_directory(dir_)) {
    error = fmt::format("Cannot create staging directory {}: {}", dir_,
                        ec ? ec.message() : "not a directory");
    return false;
  }
  LOG_DEBUG("Created staging directory {}", dir_);
  return true;
}

bool StagingArea::exists() const {
  std::error_code ec;
  return fs::is_directory(dir_, ec);
}

uint64_t StagingArea::usage_bytes() const {
  uint64_t total = 0;
  for (const auto &entry : entries())
    total += entry.size;
  return total;
}

std::vector<StagingEntry> StagingArea::entries() const {
  std::vector<StagingEntry> result;
  std::error_code ec;
  fs::directory_iterator it(dir_, ec);
  if (ec)
    return result;

  /// Files may vanish while iterating (upload cleanup), skip those
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    std::error_code entry_ec;
    if (!it->is_regular_file(entry_ec))
      continue;
    uint64_t size = it->file_size(entry_ec);
    if (entry_ec)
      continue;
    result.push_back({it->path().filename().string(), size});
  }

  std::sort(result.begin(), result.end(),
            [](const StagingEntry &a, const StagingEntry &b) {
              return a.size > b.size;
            });
  return result;
}

bool StagingArea::remove_all(std::string &error) const {
  std::error_code ec;
  fs::remove_all(dir_, ec);
  if (ec) {
    error = fmt::format("Cannot remove {}: {}", dir_, ec.message());
    return false;
  }
  return true;
}

// **---- File Helpers ----**

bool copy_file_preserving(const std::string &from, const std::string &to,
                          std::string &error) {
  std::error_code ec;
  fs::copy_file(from, to, fs::copy_options::overwrite_existing, ec);
  if (ec) {
    error = ec.message();
    return false;
  }

  /// Metadata is best-effort
  auto perms = fs::status(from, ec).permissions();
  if (!ec)
    fs::permissions(to, perms, fs::perm_options::replace, ec);
  if (ec) {
    LOG_DEBUG("Permissions not preserved for {}: {}", to, ec.message());
    ec.clear();
  }

  auto mtime = fs::last_write_time(from, ec);
  if (!ec)
    fs::last_write_time(to, mtime, ec);
  if (ec) {
    LOG_DEBUG("Modification time not preserved for {}: {}", to, ec.message());
  }
  return true;
}

bool remove_file(const std::string &path) {
  std::error_code ec;
  fs::remove(path, ec);
  if (ec) {
    LOG_WARN("Failed to delete {}: {}", path, ec.message());
    return false;
  }
  return true;
}

bool file_exists(const std::string &path) {
  std::error_code ec;
  return fs::is_regular_file(path, ec);
}

} // namespace net_stage
