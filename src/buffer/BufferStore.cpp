// Repository: Rewind
// Component: Buffer Store
// Purpose: Thread-safe registry of retained chunks, eviction and file cleanup.
// Copyright (c) 2026 Rewind

#include "rewind/buffer/BufferStore.hpp"

#include <algorithm>
#include <stdexcept>
#include <unordered_set>
#include <utility>

#include "rewind/util/Logger.hpp"

namespace rwd::buffer {

using util::Logger;

// -----------------------------------------------------------------------------
// ChunkLease
// -----------------------------------------------------------------------------

ChunkLease::ChunkLease(BufferStore* store, std::vector<Chunk> chunks)
    : store_(store), chunks_(std::move(chunks)) {}

ChunkLease::~ChunkLease() { Release(); }

ChunkLease::ChunkLease(ChunkLease&& other) noexcept
    : store_(other.store_), chunks_(std::move(other.chunks_)) {
  other.store_ = nullptr;
  other.chunks_.clear();
}

ChunkLease& ChunkLease::operator=(ChunkLease&& other) noexcept {
  if (this != &other) {
    Release();
    store_ = other.store_;
    chunks_ = std::move(other.chunks_);
    other.store_ = nullptr;
    other.chunks_.clear();
  }
  return *this;
}

void ChunkLease::Release() {
  if (store_ == nullptr) return;
  BufferStore* store = store_;
  store_ = nullptr;
  store->Release(chunks_);
}

// -----------------------------------------------------------------------------
// BufferStore
// -----------------------------------------------------------------------------

BufferStore::BufferStore(std::shared_ptr<fs::IFileOps> files)
    : files_(std::move(files)) {
  if (!files_) {
    throw std::invalid_argument("BufferStore: file ops must not be null");
  }
}

BufferStore::~BufferStore() = default;

void BufferStore::Add(Chunk chunk) {
  if (!IsStructurallyValid(chunk)) {
    throw std::invalid_argument("BufferStore: structurally invalid chunk '" +
                                chunk.path + "'");
  }
  const std::string name = chunk.FileName();
  size_t count = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto existing = std::find_if(chunks_.begin(), chunks_.end(),
                                 [&](const Chunk& c) { return c.id == chunk.id; });
    if (existing != chunks_.end()) {
      *existing = std::move(chunk);
    } else {
      chunks_.push_back(std::move(chunk));
    }
    std::stable_sort(chunks_.begin(), chunks_.end(),
                     [](const Chunk& a, const Chunk& b) {
                       return a.created_at_ms < b.created_at_ms;
                     });
    count = chunks_.size();
  }
  Logger::Info("[BufferStore] added " + name + " count=" + std::to_string(count));
}

bool BufferStore::Remove(const Chunk& chunk) {
  std::vector<Chunk> deletable;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = std::find_if(chunks_.begin(), chunks_.end(),
                           [&](const Chunk& c) { return c.id == chunk.id; });
    if (it == chunks_.end()) return false;
    std::vector<Chunk> removed{std::move(*it)};
    chunks_.erase(it);
    deletable = DetachLocked(std::move(removed));
  }
  DeleteFiles(deletable, "removed");
  return true;
}

std::vector<Chunk> BufferStore::QueryRange(int64_t from_ms, int64_t to_ms) const {
  std::vector<Chunk> out;
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& c : chunks_) {
    if (c.created_at_ms >= from_ms && c.created_at_ms <= to_ms) {
      out.push_back(c);
    }
  }
  return out;
}

size_t BufferStore::EvictExpired(int64_t now_ms, int64_t buffer_duration_ms) {
  const int64_t threshold = now_ms - buffer_duration_ms;
  std::vector<Chunk> deletable;
  size_t evicted = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    // Ascending order: the expired chunks form a prefix.
    auto first_live = std::find_if(chunks_.begin(), chunks_.end(),
                                   [&](const Chunk& c) {
                                     return c.created_at_ms >= threshold;
                                   });
    std::vector<Chunk> removed(std::make_move_iterator(chunks_.begin()),
                               std::make_move_iterator(first_live));
    chunks_.erase(chunks_.begin(), first_live);
    evicted = removed.size();
    deletable = DetachLocked(std::move(removed));
  }
  if (evicted > 0) {
    Logger::Info("[BufferStore] evicting " + std::to_string(evicted) +
                 " expired chunk(s) older than " +
                 std::to_string(buffer_duration_ms) + "ms");
  }
  DeleteFiles(deletable, "evicted");
  return evicted;
}

size_t BufferStore::ClearAll() {
  std::vector<Chunk> deletable;
  size_t cleared = 0;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<Chunk> removed;
    removed.swap(chunks_);
    cleared = removed.size();
    deletable = DetachLocked(std::move(removed));
  }
  Logger::Info("[BufferStore] clearing all chunks (" + std::to_string(cleared) + ")");
  DeleteFiles(deletable, "cleared");
  return cleared;
}

size_t BufferStore::PurgeOrphans(const std::string& dir) {
  const auto names = files_->List(dir);
  std::unordered_set<std::string> known;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : chunks_) known.insert(c.FileName());
    for (const auto& entry : retired_) known.insert(entry.second.FileName());
  }

  const std::string prefix = kChunkFilePrefix;
  size_t purged = 0;
  for (const auto& name : names) {
    if (name.compare(0, prefix.size(), prefix) != 0) continue;
    if (known.count(name) != 0) continue;
    std::string error;
    if (files_->Remove(dir + "/" + name, &error)) {
      ++purged;
    } else {
      Logger::Warn("[BufferStore] failed to purge orphan " + name + ": " + error);
    }
  }
  if (purged > 0) {
    Logger::Info("[BufferStore] purged " + std::to_string(purged) +
                 " orphaned chunk file(s) from " + dir);
  }
  return purged;
}

ChunkLease BufferStore::Lease(int64_t from_ms, int64_t to_ms) {
  std::vector<Chunk> selected;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : chunks_) {
      if (c.created_at_ms >= from_ms && c.created_at_ms <= to_ms) {
        selected.push_back(c);
        ++pins_[c.id];
      }
    }
  }
  return ChunkLease(this, std::move(selected));
}

std::vector<Chunk> BufferStore::Snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_;
}

size_t BufferStore::Size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return chunks_.size();
}

uint64_t BufferStore::TotalBytes() const {
  std::lock_guard<std::mutex> lock(mutex_);
  uint64_t total = 0;
  for (const auto& c : chunks_) total += c.size_bytes;
  return total;
}

size_t BufferStore::PendingDeletions() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return retired_.size();
}

void BufferStore::Release(const std::vector<Chunk>& chunks) {
  std::vector<Chunk> deletable;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& c : chunks) {
      auto pin = pins_.find(c.id);
      if (pin == pins_.end()) continue;
      if (--pin->second > 0) continue;
      pins_.erase(pin);
      auto retired = retired_.find(c.id);
      if (retired != retired_.end()) {
        deletable.push_back(std::move(retired->second));
        retired_.erase(retired);
      }
    }
  }
  DeleteFiles(deletable, "released");
}

std::vector<Chunk> BufferStore::DetachLocked(std::vector<Chunk> removed) {
  std::vector<Chunk> deletable;
  deletable.reserve(removed.size());
  for (auto& c : removed) {
    if (pins_.count(c.id) != 0) {
      Logger::Debug("[BufferStore] " + c.FileName() +
                    " is leased, deferring file deletion");
      std::string id = c.id;
      retired_[id] = std::move(c);
    } else {
      deletable.push_back(std::move(c));
    }
  }
  return deletable;
}

void BufferStore::DeleteFiles(const std::vector<Chunk>& chunks, const char* reason) {
  for (const auto& c : chunks) {
    std::string error;
    if (files_->Remove(c.path, &error)) {
      Logger::Info(std::string("[BufferStore] ") + reason + " " + c.FileName());
    } else {
      Logger::Warn(std::string("[BufferStore] ") + reason + " " + c.FileName() +
                   " but deleting its file failed: " + error);
    }
  }
}

}  // namespace rwd::buffer
