// Repository: Rewind
// Component: Media Probe
// Purpose: Container inspection of chunks and exported recordings via libavformat.
// Copyright (c) 2026 Rewind

#ifndef REWIND_MEDIA_MEDIA_PROBE_HPP_
#define REWIND_MEDIA_MEDIA_PROBE_HPP_

#include <cstdint>
#include <optional>
#include <string>

namespace rwd::media {

struct MediaInfo {
  int64_t duration_ms = 0;  // 0 when the container does not report one
  bool has_video = false;
  int stream_count = 0;
};

class IMediaProbe {
 public:
  virtual ~IMediaProbe() = default;

  // nullopt when the file cannot be opened as a media container (truncated
  // capture, missing moov atom, zero streams).
  virtual std::optional<MediaInfo> Probe(const std::string& path) const = 0;
};

// FFmpegMediaProbe opens the file with avformat_open_input and reads stream
// info. No decoding is done.
class FFmpegMediaProbe : public IMediaProbe {
 public:
  std::optional<MediaInfo> Probe(const std::string& path) const override;
};

}  // namespace rwd::media

#endif  // REWIND_MEDIA_MEDIA_PROBE_HPP_
