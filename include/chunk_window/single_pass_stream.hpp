#pragma once
#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/cursor.hpp"
#include "chunk_window/errors.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>

namespace cw {

// Non-repeatable provider: one cursor, one reused chunk buffer, O(chunk size)
// memory. The chunk handed out by next() is overwritten by the following
// next() or by a has_next() that has to look ahead.
class SinglePassStream final : public CursorProvider, private detail::CursorHost {
public:
  // Throws ConfigError on a null producer.
  explicit SinglePassStream(std::unique_ptr<ReusingChunkProducer> producer);
  ~SinglePassStream() override;

  SinglePassStream(const SinglePassStream&) = delete;
  SinglePassStream& operator=(const SinglePassStream&) = delete;

  // A second call throws ChunkWindowError(SinglePass), even after the first
  // cursor was released.
  std::unique_ptr<Cursor> open_cursor(const CursorOptions& opts = {}) override;
  void close() override;
  bool closed() const override;
  std::size_t open_cursors() const override;
  bool repeatable() const noexcept override { return false; }

  std::uint64_t chunks_delivered() const;

private:
  bool has_at(std::uint64_t position) override;
  ChunkPtr get_at(std::uint64_t position) override;
  void advanced(detail::CursorSlot&) override {}
  void seek_slot(detail::CursorSlot& slot, std::int64_t target) override;
  void released(detail::CursorSlot& slot) override;

  bool peek_locked();
  void release_storage_locked();

  mutable std::mutex mu_;
  std::unique_ptr<ReusingChunkProducer> producer_;
  ChunkPtr pending_;
  std::uint64_t delivered_{0};
  bool exhausted_{false};
  bool opened_{false};
  bool cursor_live_{false};
  bool closed_{false};
};

}
