// Repository: Rewind
// Component: Chunk model
// Purpose: One fixed-duration capture unit held in the rolling buffer.
// Copyright (c) 2026 Rewind

#ifndef REWIND_BUFFER_CHUNK_HPP_
#define REWIND_BUFFER_CHUNK_HPP_

#include <cstdint>
#include <string>

namespace rwd::buffer {

// Chunk file names: "<kChunkFilePrefix><sortable UTC timestamp>.<ext>".
inline constexpr const char* kChunkFilePrefix = "chunk_";

struct Chunk {
  std::string id;             // UUIDv4, assigned at creation
  std::string path;           // Absolute path of the backing media file
  int64_t created_at_ms = 0;  // UTC ms at recording start
  int64_t duration_ms = 0;    // Nominal length (chunk duration setting)
  uint64_t size_bytes = 0;    // Size observed when the chunk was registered

  std::string FileName() const;
};

// Non-empty id and path, positive duration. The store accepts every chunk
// that passes this check.
bool IsStructurallyValid(const Chunk& chunk);

std::string GenerateChunkId();

// "<dir>/chunk_2026-10-19T14-03-07.125Z.<ext>"
std::string ChunkPathFor(const std::string& dir, int64_t created_at_ms,
                         const std::string& extension);

}  // namespace rwd::buffer

#endif  // REWIND_BUFFER_CHUNK_HPP_
