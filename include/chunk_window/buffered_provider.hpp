#pragma once
#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/cursor.hpp"
#include "chunk_window/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace cw {

// Where a BufferedProvider keeps chunks it has fetched. Positions arrive in
// increasing order and are never removed one by one; clear() drops everything.
// Callers serialize access.
class ChunkStore {
public:
  virtual ~ChunkStore() = default;

  virtual void put(std::uint64_t position, ChunkPtr chunk) = 0;
  virtual ChunkPtr get(std::uint64_t position) = 0;   // nullptr when never stored
  virtual std::size_t size() const noexcept = 0;
  virtual void clear() = 0;

  // Max chunk count before admission fails; 0 means unbounded.
  virtual std::size_t limit() const noexcept { return 0; }
};

class MemoryChunkStore final : public ChunkStore {
public:
  explicit MemoryChunkStore(std::size_t max_chunks = 1000) : max_chunks_(max_chunks) {}

  void put(std::uint64_t position, ChunkPtr chunk) override;
  ChunkPtr get(std::uint64_t position) override;
  std::size_t size() const noexcept override { return chunks_.size(); }
  void clear() override { chunks_.clear(); }
  std::size_t limit() const noexcept override { return max_chunks_; }

private:
  std::size_t max_chunks_;
  std::map<std::uint64_t, ChunkPtr> chunks_;
};

// Keeps the newest chunks in memory and appends older ones to a temp file.
// A spilled chunk is read back into a fresh Chunk on every get().
class SpillChunkStore final : public ChunkStore {
public:
  struct Config {
    std::size_t max_in_memory_chunks = 100;
    std::filesystem::path spill_dir;   // empty: system temp directory
  };

  // Throws ConfigError for max_in_memory_chunks == 0, SourceIoError when the
  // spill file cannot be created.
  explicit SpillChunkStore(Config cfg);
  ~SpillChunkStore() override;

  SpillChunkStore(const SpillChunkStore&) = delete;
  SpillChunkStore& operator=(const SpillChunkStore&) = delete;

  void put(std::uint64_t position, ChunkPtr chunk) override;
  ChunkPtr get(std::uint64_t position) override;
  std::size_t size() const noexcept override { return hot_.size() + spilled_.size(); }
  void clear() override;

  std::size_t in_memory() const noexcept { return hot_.size(); }
  std::size_t spilled() const noexcept { return spilled_.size(); }
  std::uint64_t spill_bytes() const noexcept { return spill_end_; }
  const std::filesystem::path& spill_path() const noexcept { return path_; }

private:
  struct SpillRecord {
    std::uint64_t file_offset = 0;
    ChunkInfo info;
  };

  void spill_oldest();
  void close_file() noexcept;

  Config cfg_;
  std::filesystem::path path_;
  std::FILE* f_{nullptr};
  std::uint64_t spill_end_{0};
  std::map<std::uint64_t, ChunkPtr> hot_;
  std::map<std::uint64_t, SpillRecord> spilled_;
};

// Fully repeatable provider: every fetched chunk stays in the store until the
// provider is closed and its last cursor released. Cursors never pin anything,
// so seeking anywhere at or above 0 is accepted.
class BufferedProvider final : public CursorProvider, private detail::CursorHost {
public:
  // Throws ConfigError on a null producer or store.
  BufferedProvider(std::unique_ptr<CopyingChunkProducer> producer,
                   std::unique_ptr<ChunkStore> store);
  ~BufferedProvider() override;

  BufferedProvider(const BufferedProvider&) = delete;
  BufferedProvider& operator=(const BufferedProvider&) = delete;

  std::unique_ptr<Cursor> open_cursor(const CursorOptions& opts = {}) override;
  void close() override;
  bool closed() const override;
  std::size_t open_cursors() const override;
  bool repeatable() const noexcept override { return true; }

  ChunkPtr get(std::uint64_t position);
  bool has(std::uint64_t position);

  std::size_t stored_chunks() const;
  std::uint64_t next_fetch_position() const;
  bool source_exhausted() const;

private:
  bool has_at(std::uint64_t position) override { return has(position); }
  ChunkPtr get_at(std::uint64_t position) override { return get(position); }
  void advanced(detail::CursorSlot&) override {}
  void seek_slot(detail::CursorSlot& slot, std::int64_t target) override;
  void released(detail::CursorSlot& slot) override;

  void fetch_until_locked(std::uint64_t position);
  std::vector<CursorPosition> positions_locked() const;
  void release_storage_locked();

  mutable std::mutex mu_;
  std::unique_ptr<CopyingChunkProducer> producer_;
  std::unique_ptr<ChunkStore> store_;
  std::uint64_t next_fetch_{0};
  bool exhausted_{false};
  bool closed_{false};
  std::map<std::uint64_t, std::shared_ptr<detail::CursorSlot>> cursors_;
  std::uint64_t next_cursor_id_{1};
};

}
