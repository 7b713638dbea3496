#pragma once
#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/cursor.hpp"
#include "chunk_window/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <vector>

namespace cw {

// Bounded, repeatable view over a forward-only producer.
//
// Chunks are kept in an ordered position -> chunk map. A position is fetched
// the first time any cursor asks for it and evicted once every eligible
// cursor has moved past it. Memory is O(max_cached_chunks * chunk size); when
// the window cannot shrink enough to admit the next chunk, the fetch fails
// with CapacityExceededError instead of growing.
//
// One mutex guards the map, the fetch counter, the exhausted flag and the
// cursor registry; every producer pull happens under it.
class SlidingWindowCache final : public CursorProvider, private detail::CursorHost {
public:
  struct Config {
    std::size_t max_cached_chunks = 3;
  };

  struct Stats {
    std::uint64_t hits = 0;
    std::uint64_t misses = 0;
    std::uint64_t fetched = 0;
    std::uint64_t evicted = 0;
    std::uint64_t high_water = 0;
    std::uint64_t overflows = 0;
  };

  // Throws ConfigError on a null producer or max_cached_chunks == 0.
  SlidingWindowCache(std::unique_ptr<CopyingChunkProducer> producer, Config cfg);
  ~SlidingWindowCache() override;

  SlidingWindowCache(const SlidingWindowCache&) = delete;
  SlidingWindowCache& operator=(const SlidingWindowCache&) = delete;

  std::unique_ptr<Cursor> open_cursor(const CursorOptions& opts = {}) override;
  void close() override;
  bool closed() const override;
  std::size_t open_cursors() const override;
  bool repeatable() const noexcept override { return true; }

  // nullptr when the position was evicted or lies past the end of the source.
  ChunkPtr get(std::uint64_t position);
  bool has(std::uint64_t position);

  std::size_t capacity() const noexcept { return cfg_.max_cached_chunks; }
  std::size_t cached_chunks() const;
  std::uint64_t min_retained_position() const;
  std::uint64_t next_fetch_position() const;
  bool source_exhausted() const;
  std::vector<CursorPosition> cursor_positions() const;
  Stats stats() const;

private:
  bool has_at(std::uint64_t position) override { return has(position); }
  ChunkPtr get_at(std::uint64_t position) override { return get(position); }
  void advanced(detail::CursorSlot& slot) override;
  void seek_slot(detail::CursorSlot& slot, std::int64_t target) override;
  void released(detail::CursorSlot& slot) override;

  ChunkPtr get_locked(std::uint64_t position);
  void fetch_until_locked(std::uint64_t position);
  void evict_locked();
  std::uint64_t min_retained_locked() const;
  std::vector<CursorPosition> positions_locked() const;
  void release_storage_locked();

  Config cfg_;
  mutable std::mutex mu_;
  std::unique_ptr<CopyingChunkProducer> producer_;
  std::map<std::uint64_t, ChunkPtr> entries_;
  std::uint64_t next_fetch_{0};
  bool exhausted_{false};
  bool closed_{false};
  std::map<std::uint64_t, std::shared_ptr<detail::CursorSlot>> cursors_;
  std::uint64_t next_cursor_id_{1};
  Stats stats_;
};

}
