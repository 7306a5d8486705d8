// Repository: Rewind
// Component: Capture Command
// Purpose: Argument template for the fixed-duration screen capture process.
// Copyright (c) 2026 Rewind

#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace rwd::capture {

// Placeholders recognized inside template tokens.
inline constexpr const char* kOutputPlaceholder = "{output}";
inline constexpr const char* kDurationPlaceholder = "{duration}";
inline constexpr const char* kDurationMsPlaceholder = "{duration_ms}";

// ffmpeg x11grab on `display`, self-terminating after {duration} seconds.
std::vector<std::string> DefaultCaptureArgs(const std::string& display);

// Substitutes every placeholder occurrence in every token.
// {duration} is whole seconds when duration_ms is a multiple of 1000,
// otherwise seconds with millisecond precision ("7.500").
std::vector<std::string> ExpandCaptureArgs(const std::vector<std::string>& tmpl,
                                           const std::string& output_path,
                                           int64_t duration_ms);

// Whitespace split of a --capture-args value. Single quotes group.
std::vector<std::string> SplitArgs(const std::string& text);

}  // namespace rwd::capture
