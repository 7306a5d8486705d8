// Repository: Rewind
// Component: File operations
// Purpose: Filesystem capability used by the buffer, recorder and exporter.
// Copyright (c) 2026 Rewind

#include "rewind/fs/IFileOps.hpp"

#include <filesystem>
#include <fstream>
#include <system_error>

#include "rewind/RewindError.hpp"

namespace rwd::fs {

namespace stdfs = std::filesystem;

bool PosixFileOps::Remove(const std::string& path, std::string* error) {
  std::error_code ec;
  const bool removed = stdfs::remove(path, ec);
  if (ec) {
    if (error) *error = ec.message();
    return false;
  }
  if (!removed) {
    if (error) *error = "No such file";
    return false;
  }
  return true;
}

std::optional<uint64_t> PosixFileOps::SizeOf(const std::string& path) const {
  std::error_code ec;
  if (!stdfs::is_regular_file(path, ec) || ec) return std::nullopt;
  const auto size = stdfs::file_size(path, ec);
  if (ec) return std::nullopt;
  return static_cast<uint64_t>(size);
}

std::vector<std::string> PosixFileOps::List(const std::string& dir) const {
  std::vector<std::string> names;
  std::error_code ec;
  stdfs::directory_iterator it(dir, ec);
  for (; !ec && it != stdfs::directory_iterator(); it.increment(ec)) {
    std::error_code type_ec;
    if (it->is_regular_file(type_ec) && !type_ec) {
      names.push_back(it->path().filename().string());
    }
  }
  return names;
}

void PosixFileOps::EnsureDirectory(const std::string& dir) {
  std::error_code ec;
  stdfs::create_directories(dir, ec);
  if (ec) {
    throw RewindError(ErrorCode::kIoError,
                      "cannot create directory " + dir + ": " + ec.message());
  }
}

void PosixFileOps::WriteFile(const std::string& path, const std::string& contents) {
  std::ofstream of(path, std::ios::binary | std::ios::trunc);
  if (!of) {
    throw RewindError(ErrorCode::kIoError, "cannot create " + path);
  }
  of << contents;
  of.flush();
  if (!of) {
    of.close();
    std::error_code ec;
    stdfs::remove(path, ec);
    throw RewindError(ErrorCode::kIoError, "write failed " + path);
  }
}

}  // namespace rwd::fs
