// Repository: Rewind
// Component: File operations
// Purpose: Filesystem capability used by the buffer, recorder and exporter.
// Copyright (c) 2026 Rewind

#ifndef REWIND_FS_I_FILE_OPS_HPP_
#define REWIND_FS_I_FILE_OPS_HPP_

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace rwd::fs {

// IFileOps isolates the few filesystem calls the core makes, so tests can
// inject deletion failures.
class IFileOps {
 public:
  virtual ~IFileOps() = default;

  // Deletes a regular file. Returns false and fills *error on failure;
  // a file that is already gone counts as failure ("No such file").
  virtual bool Remove(const std::string& path, std::string* error) = 0;

  // Size in bytes, or nullopt when the path does not name a regular file.
  virtual std::optional<uint64_t> SizeOf(const std::string& path) const = 0;

  // Names (not paths) of the regular files directly inside dir.
  virtual std::vector<std::string> List(const std::string& dir) const = 0;

  // mkdir -p. Throws RewindError(kIoError) on failure.
  virtual void EnsureDirectory(const std::string& dir) = 0;

  // Creates or truncates path with contents. Throws RewindError(kIoError).
  virtual void WriteFile(const std::string& path, const std::string& contents) = 0;
};

// std::filesystem-backed implementation.
class PosixFileOps : public IFileOps {
 public:
  bool Remove(const std::string& path, std::string* error) override;
  std::optional<uint64_t> SizeOf(const std::string& path) const override;
  std::vector<std::string> List(const std::string& dir) const override;
  void EnsureDirectory(const std::string& dir) override;
  void WriteFile(const std::string& path, const std::string& contents) override;
};

}  // namespace rwd::fs

#endif  // REWIND_FS_I_FILE_OPS_HPP_
