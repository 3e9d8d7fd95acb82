/**
 * @file state_store.cpp
 * @brief State file serialization implementation
 */

#include "net_stage/state_store.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <system_error>

#include <fmt/core.h>

#include "net_stage/file_record.hpp"

namespace net_stage {

namespace fs = std::filesystem;
using json = nlohmann::json;

// **---- JSON Conversion ----**

namespace {

json optional_to_json(const std::optional<std::string> &value) {
  return value ? json(*value) : json(nullptr);
}

std::optional<std::string> optional_from_json(const json &j, const char *key) {
  auto it = j.find(key);
  if (it == j.end() || it->is_null())
    return std::nullopt;
  return it->get<std::string>();
}

} // anonymous namespace

void to_json(json &j, const FileRecord &record) {
  j = json{{"source_path", record.source_path},
           {"local_path", optional_to_json(record.local_path)},
           {"output_path", optional_to_json(record.output_path)},
           {"final_path", optional_to_json(record.final_path)},
           {"state", to_string(record.state)},
           {"error", optional_to_json(record.error)}};
}

void from_json(const json &j, FileRecord &record) {
  record.source_path = j.at("source_path").get<std::string>();
  record.local_path = optional_from_json(j, "local_path");
  record.output_path = optional_from_json(j, "output_path");
  record.final_path = optional_from_json(j, "final_path");
  record.error = optional_from_json(j, "error");

  std::string state_name = j.at("state").get<std::string>();
  auto state = parse_file_state(state_name);
  if (!state) {
    throw std::runtime_error(fmt::format("unknown state '{}' for {}",
                                         state_name, record.source_path));
  }
  record.state = *state;
}

// **---- StateStore ----**

StateStore::StateStore(std::string path) : path_(std::move(path)) {}

bool StateStore::exists() const {
  std::error_code ec;
  return fs::is_regular_file(path_, ec);
}

bool StateStore::save(const std::vector<FileRecord> &records,
                      std::string &error) const {
  double now = std::chrono::duration<double>(
                   std::chrono::system_clock::now().time_since_epoch())
                   .count();
  json root = {{"files", records}, {"timestamp", now}};

  /// The staging directory may have been removed by an external cleanup
  std::error_code ec;
  fs::path parent = fs::path(path_).parent_path();
  if (!parent.empty())
    fs::create_directories(parent, ec);
  if (ec) {
    error = fmt::format("cannot create {}: {}", parent.string(), ec.message());
    return false;
  }

  std::string tmp_path = path_ + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out) {
      error = fmt::format("cannot open {}", tmp_path);
      return false;
    }
    out << root.dump(2) << '\n';
    out.flush();
    if (!out) {
      error = fmt::format("write to {} failed", tmp_path);
      out.close();
      fs::remove(tmp_path, ec);
      return false;
    }
  }

  fs::rename(tmp_path, path_, ec);
  if (ec) {
    error = fmt::format("cannot replace {}: {}", path_, ec.message());
    std::error_code ignored;
    fs::remove(tmp_path, ignored);
    return false;
  }
  return true;
}

std::optional<PersistedState> StateStore::load(std::string &error) const {
  if (!exists())
    return std::nullopt;

  std::ifstream in(path_);
  if (!in) {
    error = fmt::format("cannot open {}", path_);
    return std::nullopt;
  }

  try {
    json root = json::parse(in);
    if (!root.is_object() || !root.contains("files") ||
        !root["files"].is_array()) {
      error = fmt::format("{} has no \"files\" array", path_);
      return std::nullopt;
    }

    PersistedState state;
    state.files = root["files"].get<std::vector<FileRecord>>();
    state.timestamp = root.value("timestamp", 0.0);
    return state;
  } catch (const std::exception &e) {
    error = fmt::format("cannot parse {}: {}", path_, e.what());
    return std::nullopt;
  }
}

} // namespace net_stage
