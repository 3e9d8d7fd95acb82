/**
 * @file encode_executor.cpp
 * @brief Encoder command execution and output probing implementation
 */

#include "net_stage/encode_executor.hpp"

#include <cstdlib>
#include <filesystem>

#include <fmt/core.h>
#include <fmt/format.h>

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
}

#include "net_stage/logging.hpp"

namespace net_stage {

namespace {

/**
 * @brief Closes the format context on every exit path of the probe.
 */
struct FormatContextGuard {
  AVFormatContext *ctx = nullptr;
  ~FormatContextGuard() {
    if (ctx)
      avformat_close_input(&ctx);
  }
};

} // anonymous namespace

bool probe_media_output(const std::string &path, MediaInfo &info) {
  FormatContextGuard guard;

  if (avformat_open_input(&guard.ctx, path.c_str(), nullptr, nullptr) < 0) {
    LOG_ERROR("avformat_open_input failed for {}", path);
    return false;
  }

  /// Reads a few packets to fill in the stream parameters
  if (avformat_find_stream_info(guard.ctx, nullptr) < 0) {
    LOG_ERROR("avformat_find_stream_info failed for {}", path);
    return false;
  }

  int video_stream_idx =
      av_find_best_stream(guard.ctx, AVMEDIA_TYPE_VIDEO, -1, -1, nullptr, 0);
  if (video_stream_idx < 0) {
    LOG_ERROR("No video stream found in {}", path);
    return false;
  }

  AVStream *stream = guard.ctx->streams[video_stream_idx];
  info.format = guard.ctx->iformat ? guard.ctx->iformat->name : "";
  info.video_codec = avcodec_get_name(stream->codecpar->codec_id);
  info.duration_sec = guard.ctx->duration > 0
                          ? guard.ctx->duration / static_cast<double>(AV_TIME_BASE)
                          : 0.0;
  info.frames = stream->nb_frames;
  return true;
}

std::string shell_quote(const std::string &path) {
  std::string quoted = "'";
  for (char c : path) {
    if (c == '\'')
      quoted += "'\\''";
    else
      quoted += c;
  }
  quoted += "'";
  return quoted;
}

bool execute_encode(const std::string &input_path,
                    const std::string &output_path,
                    const std::string &command_template,
                    EncodeProgress *progress) {
  std::string cmd;
  try {
    cmd = fmt::format(fmt::runtime(command_template),
                      fmt::arg("input", shell_quote(input_path)),
                      fmt::arg("output", shell_quote(output_path)));
  } catch (const fmt::format_error &e) {
    LOG_ERROR("Invalid encode command template '{}': {}", command_template,
              e.what());
    return false;
  }

  LOG_DEBUG("[Encode] Executing: {}", cmd);

  if (progress) {
    progress->fraction.store(0.0);
    progress->frames.store(0);
  }

  int status = std::system(cmd.c_str());
  if (status != 0) {
    LOG_ERROR("Encoder failed with status {} for {}", status,
              std::filesystem::path(input_path).filename().string());
    return false;
  }

  MediaInfo info;
  if (!probe_media_output(output_path, info))
    return false;

  LOG_DEBUG("[Encode] Output {}: {} / {}, {:.1f}s", output_path, info.format,
            info.video_codec, info.duration_sec);

  if (progress) {
    progress->frames.store(info.frames);
    progress->fraction.store(1.0);
  }
  return true;
}

} // namespace net_stage
