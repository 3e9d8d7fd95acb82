/**
 * @file staging_area.hpp
 * @brief Local scratch directory and file transfer helpers
 *
 * @details Provides:
 *
 *          - StagingArea: the directory shared by the three stages, recreated
 *            on demand when something deletes it mid-run
 *
 *          - copy_file_preserving(): content copy plus best-effort metadata
 *
 *          - remove_file(): deletion that reports instead of throwing
 *
 * @note Every helper uses the std::error_code overloads of std::filesystem;
 *       failures are returned to the caller, never thrown.
 */

#ifndef NET_STAGE_STAGING_AREA_HPP
#define NET_STAGE_STAGING_AREA_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace net_stage {

/**
 * @struct StagingEntry
 * @brief One regular file in the staging directory.
 */
struct StagingEntry {
  std::string name; //< File name (no directory)
  uint64_t size;    //< Size in bytes
};

/**
 * @class StagingArea
 * @brief The local scratch directory.
 */
class StagingArea {
public:
  explicit StagingArea(std::string dir);

  const std::string &dir() const { return dir_; }

  /**
   * @brief Full path of a file inside the staging directory.
   */
  std::string path_for(const std::string &name) const;

  /**
   * @brief Create the directory (and parents) if it does not exist.
   * @param error Output: description when creation fails
   * @return true if the directory exists afterwards
   */
  bool ensure(std::string &error) const;

  /// Whether the directory currently exists.
  bool exists() const;

  /**
   * @brief Total size of the regular files currently in the directory.
   * @note Reads the filesystem on every call; 0 if the directory is gone.
   */
  uint64_t usage_bytes() const;

  /**
   * @brief Regular files in the directory, largest first.
   */
  std::vector<StagingEntry> entries() const;

  /**
   * @brief Delete the directory and everything in it.
   * @param error Output: description on failure
   * @return true if nothing is left
   */
  bool remove_all(std::string &error) const;

private:
  std::string dir_;
};

/**
 * @brief Copy a file's contents, then try to carry over permissions and
 *        modification time.
 *
 * @note Metadata failures are common on network filesystems and only logged
 *       at debug level. The destination is overwritten.
 *
 * @param from Source file
 * @param to Destination file (parent must exist)
 * @param error Output: description when the content copy fails
 * @return true if the contents were copied
 */
bool copy_file_preserving(const std::string &from, const std::string &to,
                          std::string &error);

/**
 * @brief Delete a file if it exists.
 * @return true if the file is gone afterwards
 */
bool remove_file(const std::string &path);

/**
 * @brief Whether a regular file exists at `path`.
 */
bool file_exists(const std::string &path);

} // namespace net_stage

#endif // NET_STAGE_STAGING_AREA_HPP
