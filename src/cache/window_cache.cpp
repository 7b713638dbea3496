#include "chunk_window/window_cache.hpp"
#include <algorithm>
#include <iterator>
#include <limits>
#include <utility>

namespace cw {

SlidingWindowCache::SlidingWindowCache(std::unique_ptr<CopyingChunkProducer> producer, Config cfg)
  : cfg_(cfg), producer_(std::move(producer)) {
  if (!producer_) throw ConfigError("sliding-window cache needs a chunk producer");
  if (cfg_.max_cached_chunks == 0) throw ConfigError("max cached chunks must be positive: 0");
}

SlidingWindowCache::~SlidingWindowCache() = default;

std::unique_ptr<Cursor> SlidingWindowCache::open_cursor(const CursorOptions& opts) {
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) throw ProviderClosedError();
  auto slot = std::make_shared<detail::CursorSlot>(next_cursor_id_++, opts);
  cursors_.emplace(slot->id, slot);
  return std::make_unique<detail::PositionCursor>(static_cast<detail::CursorHost&>(*this),
                                                  std::move(slot));
}

void SlidingWindowCache::close() {
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
  if (cursors_.empty()) release_storage_locked();
}

bool SlidingWindowCache::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t SlidingWindowCache::open_cursors() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cursors_.size();
}

ChunkPtr SlidingWindowCache::get(std::uint64_t position) {
  std::lock_guard<std::mutex> lk(mu_);
  return get_locked(position);
}

bool SlidingWindowCache::has(std::uint64_t position) {
  std::lock_guard<std::mutex> lk(mu_);
  if (entries_.count(position)) return true;
  // below the fetch counter and not cached means evicted
  if (position < next_fetch_ || exhausted_) return false;

  const std::uint64_t before = next_fetch_;
  fetch_until_locked(position);
  const bool found = entries_.count(position) != 0;
  if (next_fetch_ != before) evict_locked();
  return found;
}

ChunkPtr SlidingWindowCache::get_locked(std::uint64_t position) {
  auto it = entries_.find(position);
  if (it != entries_.end()) {
    ++stats_.hits;
    return it->second;
  }
  ++stats_.misses;

  const std::uint64_t before = next_fetch_;
  fetch_until_locked(position);

  ChunkPtr out;
  it = entries_.find(position);
  if (it != entries_.end()) out = it->second;
  if (next_fetch_ != before) evict_locked();
  return out;
}

void SlidingWindowCache::fetch_until_locked(std::uint64_t position) {
  while (next_fetch_ <= position && !exhausted_) {
    if (entries_.size() >= cfg_.max_cached_chunks) {
      evict_locked();
      if (entries_.size() >= cfg_.max_cached_chunks) {
        ++stats_.overflows;
        throw CapacityExceededError(entries_.size(), cfg_.max_cached_chunks, positions_locked());
      }
    }

    ChunkPtr chunk;
    try {
      chunk = producer_->try_produce();
    } catch (...) {
      exhausted_ = true;
      throw;
    }
    if (!chunk) { exhausted_ = true; break; }

    entries_.emplace(next_fetch_++, std::move(chunk));
    ++stats_.fetched;
    stats_.high_water = std::max<std::uint64_t>(stats_.high_water, entries_.size());
    // the probe already told us whether this was the tail
    if (producer_->exhausted()) exhausted_ = true;
  }
}

void SlidingWindowCache::evict_locked() {
  std::uint64_t frontier = std::numeric_limits<std::uint64_t>::max();
  bool any = false;
  for (const auto& kv : cursors_) {
    const auto& slot = *kv.second;
    if (!slot.opts.eligible_for_eviction) continue;
    frontier = std::min(frontier, slot.position.load(std::memory_order_acquire));
    any = true;
  }
  if (!any) return;

  auto end = entries_.lower_bound(frontier);
  const auto n = static_cast<std::uint64_t>(std::distance(entries_.begin(), end));
  if (n == 0) return;
  entries_.erase(entries_.begin(), end);
  stats_.evicted += n;
}

std::uint64_t SlidingWindowCache::min_retained_locked() const {
  return entries_.empty() ? next_fetch_ : entries_.begin()->first;
}

std::vector<CursorPosition> SlidingWindowCache::positions_locked() const {
  std::vector<CursorPosition> out;
  out.reserve(cursors_.size());
  for (const auto& kv : cursors_) {
    const auto& slot = *kv.second;
    out.push_back(CursorPosition{slot.id, slot.opts.label,
                                 slot.position.load(std::memory_order_acquire),
                                 slot.opts.eligible_for_eviction});
  }
  return out;
}

void SlidingWindowCache::release_storage_locked() {
  entries_.clear();
  producer_.reset();
  exhausted_ = true;
}

void SlidingWindowCache::advanced(detail::CursorSlot&) {
  std::lock_guard<std::mutex> lk(mu_);
  evict_locked();
}

void SlidingWindowCache::seek_slot(detail::CursorSlot& slot, std::int64_t target) {
  std::lock_guard<std::mutex> lk(mu_);
  const auto to = static_cast<std::uint64_t>(target);
  const std::uint64_t min_retained = min_retained_locked();
  if (to < min_retained) throw EvictedPositionError(to, min_retained);
  slot.position.store(to, std::memory_order_release);
}

void SlidingWindowCache::released(detail::CursorSlot& slot) {
  std::lock_guard<std::mutex> lk(mu_);
  cursors_.erase(slot.id);
  evict_locked();
  if (cursors_.empty() && closed_) release_storage_locked();
}

std::size_t SlidingWindowCache::cached_chunks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return entries_.size();
}

std::uint64_t SlidingWindowCache::min_retained_position() const {
  std::lock_guard<std::mutex> lk(mu_);
  return min_retained_locked();
}

std::uint64_t SlidingWindowCache::next_fetch_position() const {
  std::lock_guard<std::mutex> lk(mu_);
  return next_fetch_;
}

bool SlidingWindowCache::source_exhausted() const {
  std::lock_guard<std::mutex> lk(mu_);
  return exhausted_;
}

std::vector<CursorPosition> SlidingWindowCache::cursor_positions() const {
  std::lock_guard<std::mutex> lk(mu_);
  return positions_locked();
}

SlidingWindowCache::Stats SlidingWindowCache::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  return stats_;
}

}
