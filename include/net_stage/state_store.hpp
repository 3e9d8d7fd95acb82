/**
 * @file state_store.hpp
 * @brief Durable side file holding every FileRecord of a batch
 *
 * @details File format (JSON, two-space indent):
 *
 *          {
 *            "files": [
 *              { "source_path": "...", "local_path": "..." | null,
 *                "output_path": "..." | null, "final_path": "..." | null,
 *                "state": "pending" | ... | "failed",
 *                "error": "..." | null }, ...
 *            ],
 *            "timestamp": <seconds since epoch>
 *          }
 *
 * @attention DURABILITY:
 *
 *   - save() writes "<path>.tmp" then renames it over the state file, so a
 *     crash mid-write leaves the previous version intact
 *
 *   - The parent directory is recreated if it disappeared
 *
 *   - There is no schema version; unknown keys are ignored on load
 */

#ifndef NET_STAGE_STATE_STORE_HPP
#define NET_STAGE_STATE_STORE_HPP

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "types.hpp"

namespace net_stage {

/// JSON conversion for nlohmann::json (found through ADL)
void to_json(nlohmann::json &j, const FileRecord &record);
void from_json(const nlohmann::json &j, FileRecord &record);

/**
 * @struct PersistedState
 * @brief Contents of one state file.
 */
struct PersistedState {
  std::vector<FileRecord> files;
  double timestamp = 0.0; //< Seconds since epoch of the save
};

/**
 * @class StateStore
 * @brief Reads and writes the state file.
 * @note Not synchronized; the coordinator serializes calls.
 */
class StateStore {
public:
  explicit StateStore(std::string path);

  const std::string &path() const { return path_; }

  /// Whether a state file is present.
  bool exists() const;

  /**
   * @brief Serialize the records with the current time.
   * @param error Output: description on failure
   * @return true if the state file was replaced
   */
  bool save(const std::vector<FileRecord> &records, std::string &error) const;

  /**
   * @brief Read and parse the state file.
   * @param error Output: description on failure (empty if simply absent)
   * @return The parsed state, or std::nullopt if absent or unreadable
   */
  std::optional<PersistedState> load(std::string &error) const;

private:
  std::string path_;
};

} // namespace net_stage

#endif // NET_STAGE_STATE_STORE_HPP
