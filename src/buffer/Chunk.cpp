// Repository: Rewind
// Component: Chunk model
// Purpose: One fixed-duration capture unit held in the rolling buffer.
// Copyright (c) 2026 Rewind

#include "rewind/buffer/Chunk.hpp"

#include <random>

#include "rewind/util/Timestamp.hpp"

namespace rwd::buffer {

std::string Chunk::FileName() const {
  const auto slash = path.find_last_of('/');
  return slash == std::string::npos ? path : path.substr(slash + 1);
}

bool IsStructurallyValid(const Chunk& chunk) {
  return !chunk.id.empty() && !chunk.path.empty() && chunk.duration_ms > 0;
}

std::string GenerateChunkId() {
  static thread_local std::random_device rd;
  static thread_local std::mt19937 gen(rd());
  static thread_local std::uniform_int_distribution<int> dis(0, 15);
  const char* hexdig = "0123456789abcdef";
  std::string out;
  out.reserve(36);
  for (int i = 0; i < 32; ++i) {
    if (i == 8 || i == 12 || i == 16 || i == 20) out += '-';
    if (i == 12) out += '4';
    else if (i == 16) out += hexdig[8 + dis(gen) % 4];
    else out += hexdig[dis(gen)];
  }
  return out;
}

std::string ChunkPathFor(const std::string& dir, int64_t created_at_ms,
                         const std::string& extension) {
  return dir + "/" + kChunkFilePrefix +
         util::FormatUtcForFileName(created_at_ms, /*with_millis=*/true) + "." +
         extension;
}

}  // namespace rwd::buffer
