// Repository: Rewind
// Component: Timestamp formatting
// Purpose: UTC timestamps for log lines and sortable file names.
// Copyright (c) 2026 Rewind

#ifndef REWIND_UTIL_TIMESTAMP_HPP_
#define REWIND_UTIL_TIMESTAMP_HPP_

#include <cstdint>
#include <string>

namespace rwd::util {

// "2026-10-19T14:03:07.125Z". Empty string if the time is unrepresentable.
std::string FormatUtcIso8601(int64_t utc_ms);

// File-name safe, lexicographically sortable:
//   with_millis=true  → "2026-10-19T14-03-07.125Z"
//   with_millis=false → "2026-10-19T14-03-07Z"
std::string FormatUtcForFileName(int64_t utc_ms, bool with_millis);

}  // namespace rwd::util

#endif  // REWIND_UTIL_TIMESTAMP_HPP_
