#include "chunk_window/single_pass_stream.hpp"
#include <string>
#include <utility>

namespace cw {

SinglePassStream::SinglePassStream(std::unique_ptr<ReusingChunkProducer> producer)
  : producer_(std::move(producer)) {
  if (!producer_) throw ConfigError("single-pass stream needs a chunk producer");
}

SinglePassStream::~SinglePassStream() = default;

std::unique_ptr<Cursor> SinglePassStream::open_cursor(const CursorOptions& opts) {
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) throw ProviderClosedError();
  if (opened_) {
    throw ChunkWindowError(ErrorKind::SinglePass,
                           "non-repeatable stream already has its one cursor");
  }
  opened_ = true;
  cursor_live_ = true;
  auto slot = std::make_shared<detail::CursorSlot>(1, opts);
  return std::make_unique<detail::PositionCursor>(static_cast<detail::CursorHost&>(*this),
                                                  std::move(slot));
}

void SinglePassStream::close() {
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
  if (!cursor_live_) release_storage_locked();
}

bool SinglePassStream::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t SinglePassStream::open_cursors() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cursor_live_ ? 1 : 0;
}

std::uint64_t SinglePassStream::chunks_delivered() const {
  std::lock_guard<std::mutex> lk(mu_);
  return delivered_;
}

bool SinglePassStream::peek_locked() {
  if (pending_) return true;
  if (exhausted_) return false;
  try {
    pending_ = producer_->try_produce();
  } catch (...) {
    exhausted_ = true;
    throw;
  }
  if (!pending_) exhausted_ = true;
  return pending_ != nullptr;
}

bool SinglePassStream::has_at(std::uint64_t position) {
  std::lock_guard<std::mutex> lk(mu_);
  if (position != delivered_) return false;
  return peek_locked();
}

ChunkPtr SinglePassStream::get_at(std::uint64_t position) {
  std::lock_guard<std::mutex> lk(mu_);
  if (position != delivered_ || !peek_locked()) return nullptr;
  ++delivered_;
  return std::move(pending_);
}

void SinglePassStream::seek_slot(detail::CursorSlot& slot, std::int64_t target) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto to = static_cast<std::uint64_t>(target);
  if (to != delivered_) {
    throw ChunkWindowError(ErrorKind::InvalidSeek,
                           "non-repeatable stream cannot seek from " +
                           std::to_string(delivered_) + " to " + std::to_string(to));
  }
  slot.position.store(to, std::memory_order_release);
}

void SinglePassStream::released(detail::CursorSlot&) {
  std::lock_guard<std::mutex> lk(mu_);
  cursor_live_ = false;
  if (closed_) release_storage_locked();
}

void SinglePassStream::release_storage_locked() {
  pending_.reset();
  producer_.reset();
  exhausted_ = true;
}

}
