// Repository: Rewind
// Component: Buffer Store
// Purpose: Thread-safe registry of retained chunks, eviction and file cleanup.
// Copyright (c) 2026 Rewind

#ifndef REWIND_BUFFER_BUFFER_STORE_HPP_
#define REWIND_BUFFER_BUFFER_STORE_HPP_

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "rewind/buffer/Chunk.hpp"
#include "rewind/fs/IFileOps.hpp"

namespace rwd::buffer {

class BufferStore;

// ChunkLease is a snapshot of chunks plus a pin on each of them. While a
// chunk is pinned, eviction still drops its record from the store but the
// backing file is kept until the last lease on it is released. Leases must
// not outlive the store that issued them.
class ChunkLease {
 public:
  ChunkLease() = default;
  ~ChunkLease();

  ChunkLease(ChunkLease&& other) noexcept;
  ChunkLease& operator=(ChunkLease&& other) noexcept;
  ChunkLease(const ChunkLease&) = delete;
  ChunkLease& operator=(const ChunkLease&) = delete;

  const std::vector<Chunk>& chunks() const { return chunks_; }
  bool empty() const { return chunks_.empty(); }

  // Unpins early. Idempotent.
  void Release();

 private:
  friend class BufferStore;
  ChunkLease(BufferStore* store, std::vector<Chunk> chunks);

  BufferStore* store_ = nullptr;
  std::vector<Chunk> chunks_;
};

// BufferStore is the authoritative ordered set of live chunks.
//
// Ordering: chunks are kept ascending by created_at_ms.
// Locking: a single mutex serializes every list read and mutation; it is
// never held across file I/O. A removal drops the record under the lock and
// then deletes the file before returning, so readers never see a record
// whose file is being deleted.
// Invariant: every chunk in the store had an existing, non-empty backing
// file when it was added (checked by the recorder; not re-verified here).
class BufferStore {
 public:
  explicit BufferStore(std::shared_ptr<fs::IFileOps> files);
  ~BufferStore();

  BufferStore(const BufferStore&) = delete;
  BufferStore& operator=(const BufferStore&) = delete;

  // Inserts and keeps ascending order. Throws std::invalid_argument only for
  // a structurally invalid chunk (see IsStructurallyValid).
  void Add(Chunk chunk);

  // Removes the record and deletes its file. A failed deletion is logged,
  // not raised. Returns false if no record with that id exists.
  bool Remove(const Chunk& chunk);

  // Chunks with created_at_ms in [from_ms, to_ms], ascending. Pure read.
  std::vector<Chunk> QueryRange(int64_t from_ms, int64_t to_ms) const;

  // Removes every chunk with created_at_ms < now_ms - buffer_duration_ms.
  // Returns the number of records removed.
  size_t EvictExpired(int64_t now_ms, int64_t buffer_duration_ms);

  // Removes every chunk unconditionally. Returns the number removed.
  size_t ClearAll();

  // Deletes chunk files in dir that the store does not know about
  // (leftovers of a previous process). Returns the number deleted.
  size_t PurgeOrphans(const std::string& dir);

  // Same selection as QueryRange, pinned until the lease is released.
  ChunkLease Lease(int64_t from_ms, int64_t to_ms);

  std::vector<Chunk> Snapshot() const;
  size_t Size() const;
  uint64_t TotalBytes() const;

  // Evicted chunks whose file deletion is waiting on a lease.
  size_t PendingDeletions() const;

 private:
  friend class ChunkLease;

  void Release(const std::vector<Chunk>& chunks);

  // Requires mutex_ held. Moves pinned chunks to retired_ and returns the
  // ones whose files can be deleted now.
  std::vector<Chunk> DetachLocked(std::vector<Chunk> removed);

  void DeleteFiles(const std::vector<Chunk>& chunks, const char* reason);

  std::shared_ptr<fs::IFileOps> files_;

  mutable std::mutex mutex_;
  std::vector<Chunk> chunks_;
  std::unordered_map<std::string, int> pins_;
  std::unordered_map<std::string, Chunk> retired_;
};

}  // namespace rwd::buffer

#endif  // REWIND_BUFFER_BUFFER_STORE_HPP_
