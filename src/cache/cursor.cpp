#include "chunk_window/cursor.hpp"
#include "chunk_window/errors.hpp"
#include <utility>

namespace cw::detail {

PositionCursor::PositionCursor(CursorHost& host, std::shared_ptr<CursorSlot> slot)
  : host_(&host), slot_(std::move(slot)) {}

PositionCursor::~PositionCursor() { release(); }

bool PositionCursor::has_next() {
  if (released_) return false;
  return host_->has_at(slot_->position.load(std::memory_order_acquire));
}

ChunkPtr PositionCursor::next() {
  if (released_) throw CursorReleasedError("read");

  const std::uint64_t pos = slot_->position.load(std::memory_order_acquire);
  ChunkPtr chunk = host_->get_at(pos);
  if (!chunk) throw NoSuchChunkError(pos);

  slot_->position.store(pos + 1, std::memory_order_release);
  host_->advanced(*slot_);
  return chunk;
}

void PositionCursor::seek(std::int64_t target) {
  if (released_) throw CursorReleasedError("seek");
  if (target < 0) {
    throw ChunkWindowError(ErrorKind::InvalidSeek,
                           "cannot seek to negative position: " + std::to_string(target));
  }
  host_->seek_slot(*slot_, target);
}

std::uint64_t PositionCursor::position() const noexcept {
  return slot_->position.load(std::memory_order_acquire);
}

void PositionCursor::release() {
  if (released_) return;
  released_ = true;
  host_->released(*slot_);
}

}
