/**
 * @file encode_executor.hpp
 * @brief Default encode callback: external encoder command plus output probe
 *
 * @details The coordinator only knows the EncodeCallback signature. The CLI
 *          plugs this executor in:
 *
 *          - Formats the configured command template with the quoted input
 *            and output paths and runs it through the shell
 *
 *          - Opens the result with libavformat to make sure the encoder left
 *            a readable container with a video stream behind
 */

#ifndef NET_STAGE_ENCODE_EXECUTOR_HPP
#define NET_STAGE_ENCODE_EXECUTOR_HPP

#include <cstdint>
#include <string>

#include "types.hpp"

namespace net_stage {

/**
 * @struct MediaInfo
 * @brief What the probe learned about an encoded file.
 */
struct MediaInfo {
  std::string format;      //< Container short name
  std::string video_codec; //< Codec name of the best video stream
  double duration_sec = 0.0;
  int64_t frames = 0; //< 0 when the container does not say
};

/**
 * @brief Open a media file and look for a video stream.
 *
 * @param path File to probe
 * @param info Output: container and stream details
 * @return true if the container opened and has a video stream
 */
bool probe_media_output(const std::string &path, MediaInfo &info);

/**
 * @brief Quote a path for the shell (single quotes).
 */
std::string shell_quote(const std::string &path);

/**
 * @brief Run the encoder command for one file.
 *
 * @param input_path Local input in the staging directory
 * @param output_path Where the encoder must write
 * @param command_template Command with {input} and {output} placeholders
 * @param progress Optional handle; set to 1.0 / probed frame count on success
 * @return true if the command exited 0 and the output probes as video
 */
bool execute_encode(const std::string &input_path,
                    const std::string &output_path,
                    const std::string &command_template,
                    EncodeProgress *progress = nullptr);

} // namespace net_stage

#endif // NET_STAGE_ENCODE_EXECUTOR_HPP
