// Repository: Rewind
// Component: Capture Command
// Purpose: Argument template for the fixed-duration screen capture process.
// Copyright (c) 2026 Rewind

#include "rewind/capture/CaptureCommand.hpp"

#include <cctype>
#include <cstdio>

namespace rwd::capture {

namespace {

void ReplaceAll(std::string& s, const std::string& from, const std::string& to) {
  size_t pos = 0;
  while ((pos = s.find(from, pos)) != std::string::npos) {
    s.replace(pos, from.size(), to);
    pos += to.size();
  }
}

std::string FormatSeconds(int64_t duration_ms) {
  if (duration_ms % 1000 == 0) return std::to_string(duration_ms / 1000);
  char buf[32];
  std::snprintf(buf, sizeof(buf), "%lld.%03lld",
                static_cast<long long>(duration_ms / 1000),
                static_cast<long long>(duration_ms % 1000));
  return buf;
}

}  // namespace

std::vector<std::string> DefaultCaptureArgs(const std::string& display) {
  return {
      "-nostdin",  "-hide_banner", "-loglevel", "error",
      "-y",        "-f",           "x11grab",   "-framerate",
      "30",        "-i",           display,     "-t",
      kDurationPlaceholder,
      "-c:v",      "libx264",      "-preset",   "ultrafast",
      "-pix_fmt",  "yuv420p",
      kOutputPlaceholder,
  };
}

std::vector<std::string> ExpandCaptureArgs(const std::vector<std::string>& tmpl,
                                           const std::string& output_path,
                                           int64_t duration_ms) {
  const std::string seconds = FormatSeconds(duration_ms);
  const std::string millis = std::to_string(duration_ms);
  std::vector<std::string> out;
  out.reserve(tmpl.size());
  for (std::string token : tmpl) {
    ReplaceAll(token, kDurationMsPlaceholder, millis);
    ReplaceAll(token, kDurationPlaceholder, seconds);
    ReplaceAll(token, kOutputPlaceholder, output_path);
    out.push_back(std::move(token));
  }
  return out;
}

std::vector<std::string> SplitArgs(const std::string& text) {
  std::vector<std::string> out;
  std::string current;
  bool in_token = false;
  bool quoted = false;
  for (char c : text) {
    if (quoted) {
      if (c == '\'') {
        quoted = false;
      } else {
        current.push_back(c);
      }
      continue;
    }
    if (c == '\'') {
      quoted = true;
      in_token = true;
    } else if (std::isspace(static_cast<unsigned char>(c))) {
      if (in_token) {
        out.push_back(current);
        current.clear();
        in_token = false;
      }
    } else {
      current.push_back(c);
      in_token = true;
    }
  }
  if (in_token) out.push_back(current);
  return out;
}

}  // namespace rwd::capture
