#pragma once
#include "chunk_window/chunk.hpp"
#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <utility>

namespace cw {

struct CursorOptions {
  // false: the cursor is ignored when computing the eviction frontier, so a
  // consumer that opens but never advances cannot pin the window.
  bool eligible_for_eviction = true;
  std::string label;  // shows up in overflow diagnostics
};

// Independent read head over a chunk sequence. Owned and driven by one thread.
class Cursor {
public:
  virtual ~Cursor() = default;

  virtual bool has_next() = 0;
  virtual ChunkPtr next() = 0;                  // throws NoSuchChunkError, CursorReleasedError
  virtual void seek(std::int64_t target) = 0;   // throws EvictedPositionError and friends
  virtual std::uint64_t position() const noexcept = 0;
  virtual void release() = 0;                   // idempotent
  virtual bool released() const noexcept = 0;
  virtual std::uint64_t id() const noexcept = 0;
};

// Hands out cursors over one chunk sequence. Must outlive every cursor it opened.
class CursorProvider {
public:
  virtual ~CursorProvider() = default;

  virtual std::unique_ptr<Cursor> open_cursor(const CursorOptions& opts = {}) = 0;
  virtual void close() = 0;
  virtual bool closed() const = 0;
  virtual std::size_t open_cursors() const = 0;
  virtual bool repeatable() const noexcept = 0;
};

namespace detail {

struct CursorSlot {
  CursorSlot(std::uint64_t i, CursorOptions o) : id(i), opts(std::move(o)) {}

  const std::uint64_t id;
  const CursorOptions opts;
  // written by the owning thread, read by frontier computation on any thread
  std::atomic<std::uint64_t> position{0};
};

// What a PositionCursor needs from its provider. Every call is serialized by
// the provider; the cursor itself never touches provider state.
class CursorHost {
public:
  virtual ~CursorHost() = default;
  virtual bool has_at(std::uint64_t position) = 0;
  virtual ChunkPtr get_at(std::uint64_t position) = 0;
  virtual void advanced(CursorSlot& slot) = 0;
  virtual void seek_slot(CursorSlot& slot, std::int64_t target) = 0;
  virtual void released(CursorSlot& slot) = 0;
};

class PositionCursor final : public Cursor {
public:
  PositionCursor(CursorHost& host, std::shared_ptr<CursorSlot> slot);
  ~PositionCursor() override;

  PositionCursor(const PositionCursor&) = delete;
  PositionCursor& operator=(const PositionCursor&) = delete;

  bool has_next() override;
  ChunkPtr next() override;
  void seek(std::int64_t target) override;
  std::uint64_t position() const noexcept override;
  void release() override;
  bool released() const noexcept override { return released_; }
  std::uint64_t id() const noexcept override { return slot_->id; }

private:
  CursorHost* host_;
  std::shared_ptr<CursorSlot> slot_;
  bool released_{false};
};

}

}
