// Repository: Rewind
// Component: Timestamp formatting
// Purpose: UTC timestamps for log lines and sortable file names.
// Copyright (c) 2026 Rewind

#include "rewind/util/Timestamp.hpp"

#include <cstdio>
#include <ctime>

namespace rwd::util {

namespace {

bool SplitUtc(int64_t utc_ms, struct tm* tm, int* frac_ms) {
  int64_t secs = utc_ms / 1000;
  int64_t rem = utc_ms % 1000;
  if (rem < 0) {
    rem += 1000;
    secs -= 1;
  }
  time_t s = static_cast<time_t>(secs);
  if (gmtime_r(&s, tm) == nullptr) return false;
  *frac_ms = static_cast<int>(rem);
  return true;
}

}  // namespace

std::string FormatUtcIso8601(int64_t utc_ms) {
  struct tm tm;
  int frac_ms = 0;
  if (!SplitUtc(utc_ms, &tm, &frac_ms)) return "";
  char buf[64];
  int n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                   tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                   tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

std::string FormatUtcForFileName(int64_t utc_ms, bool with_millis) {
  struct tm tm;
  int frac_ms = 0;
  if (!SplitUtc(utc_ms, &tm, &frac_ms)) return "";
  char buf[64];
  int n;
  if (with_millis) {
    n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d-%02d-%02d.%03dZ",
                 tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                 tm.tm_hour, tm.tm_min, tm.tm_sec, frac_ms);
  } else {
    n = snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d-%02d-%02dZ",
                 tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                 tm.tm_hour, tm.tm_min, tm.tm_sec);
  }
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "";
  return std::string(buf, static_cast<size_t>(n));
}

}  // namespace rwd::util
