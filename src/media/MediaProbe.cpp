// Repository: Rewind
// Component: Media Probe
// Purpose: Container inspection of chunks and exported recordings via libavformat.
// Copyright (c) 2026 Rewind

#include "rewind/media/MediaProbe.hpp"

#include "rewind/util/Logger.hpp"

extern "C" {
#include <libavformat/avformat.h>
#include <libavutil/avutil.h>
#include <libavutil/error.h>
}

namespace rwd::media {

using util::Logger;

namespace {

std::string AvError(int ret) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(ret, errbuf, sizeof(errbuf));
  return errbuf;
}

}  // namespace

std::optional<MediaInfo> FFmpegMediaProbe::Probe(const std::string& path) const {
  AVFormatContext* format_ctx = nullptr;
  int ret = avformat_open_input(&format_ctx, path.c_str(), nullptr, nullptr);
  if (ret < 0) {
    // avformat_open_input frees the context on failure.
    Logger::Warn("[MediaProbe] open_input FAILED path=" + path +
                 " ret=" + std::to_string(ret) + " err=" + AvError(ret));
    return std::nullopt;
  }

  ret = avformat_find_stream_info(format_ctx, nullptr);
  if (ret < 0) {
    Logger::Warn("[MediaProbe] find_stream_info FAILED path=" + path +
                 " ret=" + std::to_string(ret) + " err=" + AvError(ret));
    avformat_close_input(&format_ctx);
    return std::nullopt;
  }

  MediaInfo info;
  info.stream_count = static_cast<int>(format_ctx->nb_streams);
  for (unsigned int i = 0; i < format_ctx->nb_streams; ++i) {
    if (format_ctx->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      info.has_video = true;
      break;
    }
  }
  if (format_ctx->duration != AV_NOPTS_VALUE && format_ctx->duration > 0) {
    // AVFormatContext::duration is in AV_TIME_BASE (microseconds).
    info.duration_ms = format_ctx->duration / (AV_TIME_BASE / 1000);
  }
  avformat_close_input(&format_ctx);

  if (info.stream_count == 0) {
    Logger::Warn("[MediaProbe] no streams in " + path);
    return std::nullopt;
  }
  Logger::Debug("[MediaProbe] " + path + " streams=" +
                std::to_string(info.stream_count) +
                " duration_ms=" + std::to_string(info.duration_ms));
  return info;
}

}  // namespace rwd::media
