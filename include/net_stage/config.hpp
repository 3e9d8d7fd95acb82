/**
 * @file config.hpp
 * @brief Configuration management via environment variables
 *
 * @details Provides a Config namespace with lazy-initialized, memoized
 *          configuration parameters loaded from environment variables, and
 *          the PipelineOptions value type the coordinator is built from.
 *          See config/net_stage.env for detailed documentation of each
 *          parameter.
 *
 */

#ifndef NET_STAGE_CONFIG_HPP
#define NET_STAGE_CONFIG_HPP

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace net_stage {
namespace Config {

/**
 * @brief Get a double value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed double value or default
 */
inline double get_env_double(const char *name, double default_val) {
  const char *val = std::getenv(name);
  return val ? std::stod(val) : default_val;
}

/**
 * @brief Get an integer value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set
 * @return Parsed integer value or default
 */
inline int get_env_int(const char *name, int default_val) {
  const char *val = std::getenv(name);
  return val ? std::stoi(val) : default_val;
}

/**
 * @brief Get a string value from environment variable.
 * @param name Environment variable name
 * @param default_val Default value if not set or empty
 */
inline std::string get_env_string(const char *name,
                                  const std::string &default_val) {
  const char *val = std::getenv(name);
  return (val && *val) ? std::string(val) : default_val;
}

/**
 * @brief Get a boolean (0 / non-zero) value from environment variable.
 */
inline bool get_env_bool(const char *name, bool default_val) {
  return get_env_int(name, default_val ? 1 : 0) != 0;
}

/// Local scratch directory shared by all three stages
inline std::string staging_dir() {
  static std::string val = get_env_string(
      "STAGING_DIR",
      (std::filesystem::temp_directory_path() / "net_stage").string());
  return val;
}

/// Maximum number of downloaded files waiting for the encoder
inline int max_buffer_size() {
  static int val = get_env_int("MAX_BUFFER_SIZE", 4);
  return val;
}

/**
 * @brief Byte quota of the staging directory in GB (0 = no quota)
 * @note Downloads pause while the staging directory holds at least this much.
 */
inline double max_staging_gb() {
  static double val = get_env_double("MAX_STAGING_GB", 0.0);
  return val;
}

/**
 * @brief Replace originals instead of writing "<stem>_reencoded" files
 * @note When enabled the source is deleted after a successful upload.
 */
inline bool replace_original() {
  static bool val = get_env_bool("REPLACE_ORIGINAL", false);
  return val;
}

/// Extension of encoded files, including the dot
inline std::string output_extension() {
  static std::string val = get_env_string("OUTPUT_EXTENSION", ".mp4");
  return val;
}

/// Queue poll timeout; bounds how long a stage takes to notice cancellation
inline int poll_interval_ms() {
  static int val = get_env_int("POLL_INTERVAL_MS", 1000);
  return val;
}

/// Sleep between backpressure re-checks
inline int pause_interval_ms() {
  static int val = get_env_int("PAUSE_INTERVAL_MS", 1000);
  return val;
}

/// How long stop() waits for each stage before abandoning it
inline int join_timeout_sec() {
  static int val = get_env_int("JOIN_TIMEOUT_SEC", 5);
  return val;
}

/// Enable LOG_DEBUG output
inline bool verbose() {
  static bool val = get_env_bool("VERBOSE", false);
  return val;
}

/**
 * @brief Encoder command template used by the CLI
 * @note {input} and {output} are replaced with the quoted staging paths.
 */
inline std::string encode_command() {
  static std::string val = get_env_string(
      "ENCODE_COMMAND", "ffmpeg -y -hide_banner -loglevel error -i {input} "
                        "-c:v libx265 -crf 23 -c:a copy {output}");
  return val;
}

} // namespace Config

/**
 * @struct PipelineOptions
 * @brief Knobs of one PipelineCoordinator.
 * @note Defaults match the environment defaults; from_env() reads Config::.
 */
struct PipelineOptions {
  std::string staging_dir;          //< Local scratch directory
  size_t max_buffer_size = 4;       //< Count limit on LOCAL records
  uint64_t max_staging_bytes = 0;   //< Byte quota (0 = none)
  bool replace_original = false;    //< Final path policy
  std::string output_extension = ".mp4";
  std::chrono::milliseconds poll_interval{1000};
  std::chrono::milliseconds pause_interval{1000};
  std::chrono::milliseconds join_timeout{5000};

  /**
   * @brief Build options from the environment (Config::).
   */
  static PipelineOptions from_env() {
    PipelineOptions o;
    o.staging_dir = Config::staging_dir();
    o.max_buffer_size =
        static_cast<size_t>(std::max(1, Config::max_buffer_size()));
    o.max_staging_bytes =
        Config::max_staging_gb() > 0
            ? static_cast<uint64_t>(Config::max_staging_gb() * 1024.0 *
                                    1024.0 * 1024.0)
            : 0;
    o.replace_original = Config::replace_original();
    o.output_extension = Config::output_extension();
    o.poll_interval = std::chrono::milliseconds(Config::poll_interval_ms());
    o.pause_interval = std::chrono::milliseconds(Config::pause_interval_ms());
    o.join_timeout = std::chrono::seconds(Config::join_timeout_sec());
    return o;
  }
};

} // namespace net_stage

#endif // NET_STAGE_CONFIG_HPP
