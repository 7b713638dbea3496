#include "chunk_window/buffered_provider.hpp"
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <system_error>
#include <sys/types.h>
#include <unistd.h>
#include <utility>

namespace cw {

// ---------------- MemoryChunkStore ----------------

void MemoryChunkStore::put(std::uint64_t position, ChunkPtr chunk) {
  chunks_.emplace(position, std::move(chunk));
}

ChunkPtr MemoryChunkStore::get(std::uint64_t position) {
  auto it = chunks_.find(position);
  return it == chunks_.end() ? nullptr : it->second;
}

// ---------------- SpillChunkStore ----------------

static std::string io_message(const char* what, const std::filesystem::path& p, int e) {
  return std::string(what) + " '" + p.string() + "': " + std::strerror(e);
}

SpillChunkStore::SpillChunkStore(Config cfg) : cfg_(std::move(cfg)) {
  if (cfg_.max_in_memory_chunks == 0)
    throw ConfigError("max in-memory chunks must be positive: 0");

  std::filesystem::path dir = cfg_.spill_dir;
  if (dir.empty()) {
    std::error_code ec;
    dir = std::filesystem::temp_directory_path(ec);
    if (ec) throw SourceIoError("no temp directory for spill file: " + ec.message());
  }

  std::string tmpl = (dir / "cw-spill-XXXXXX").string();
  int fd = ::mkstemp(tmpl.data());
  if (fd < 0) {
    int e = errno;
    throw SourceIoError(io_message("cannot create spill file in", dir, e), e);
  }
  path_ = tmpl;
  f_ = ::fdopen(fd, "w+b");
  if (!f_) {
    int e = errno;
    ::close(fd);
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    throw SourceIoError(io_message("cannot open spill file", path_, e), e);
  }
}

SpillChunkStore::~SpillChunkStore() { close_file(); }

void SpillChunkStore::close_file() noexcept {
  if (f_) {
    std::fclose(f_);
    f_ = nullptr;
  }
  if (!path_.empty()) {
    std::error_code ec;
    std::filesystem::remove(path_, ec);
    path_.clear();
  }
}

void SpillChunkStore::put(std::uint64_t position, ChunkPtr chunk) {
  hot_.emplace(position, std::move(chunk));
  while (hot_.size() > cfg_.max_in_memory_chunks) spill_oldest();
}

void SpillChunkStore::spill_oldest() {
  if (!f_) throw SourceIoError("spill file already closed");
  auto it = hot_.begin();
  const Chunk& c = *it->second;

  if (::fseeko(f_, static_cast<off_t>(spill_end_), SEEK_SET) != 0 ||
      std::fwrite(c.data(), 1, c.length(), f_) != c.length() ||
      std::fflush(f_) != 0) {
    int e = errno;
    throw SourceIoError(io_message("write failed on spill file", path_, e), e);
  }

  spilled_.emplace(it->first, SpillRecord{spill_end_, c.info()});
  spill_end_ += c.length();
  hot_.erase(it);
}

ChunkPtr SpillChunkStore::get(std::uint64_t position) {
  auto hit = hot_.find(position);
  if (hit != hot_.end()) return hit->second;

  auto sit = spilled_.find(position);
  if (sit == spilled_.end()) return nullptr;
  if (!f_) throw SourceIoError("spill file already closed");

  const SpillRecord& rec = sit->second;
  std::vector<std::uint8_t> data(rec.info.length);
  if (::fseeko(f_, static_cast<off_t>(rec.file_offset), SEEK_SET) != 0 ||
      std::fread(data.data(), 1, data.size(), f_) != data.size()) {
    int e = errno;
    throw SourceIoError(io_message("read failed on spill file", path_, e), e);
  }
  return std::make_shared<Chunk>(std::move(data), rec.info);
}

void SpillChunkStore::clear() {
  hot_.clear();
  spilled_.clear();
  spill_end_ = 0;
  close_file();
}

// ---------------- BufferedProvider ----------------

BufferedProvider::BufferedProvider(std::unique_ptr<CopyingChunkProducer> producer,
                                   std::unique_ptr<ChunkStore> store)
  : producer_(std::move(producer)), store_(std::move(store)) {
  if (!producer_) throw ConfigError("buffered provider needs a chunk producer");
  if (!store_) throw ConfigError("buffered provider needs a chunk store");
}

BufferedProvider::~BufferedProvider() = default;

std::unique_ptr<Cursor> BufferedProvider::open_cursor(const CursorOptions& opts) {
  std::lock_guard<std::mutex> lk(mu_);
  if (closed_) throw ProviderClosedError();
  auto slot = std::make_shared<detail::CursorSlot>(next_cursor_id_++, opts);
  cursors_.emplace(slot->id, slot);
  return std::make_unique<detail::PositionCursor>(static_cast<detail::CursorHost&>(*this),
                                                  std::move(slot));
}

void BufferedProvider::close() {
  std::lock_guard<std::mutex> lk(mu_);
  closed_ = true;
  if (cursors_.empty()) release_storage_locked();
}

bool BufferedProvider::closed() const {
  std::lock_guard<std::mutex> lk(mu_);
  return closed_;
}

std::size_t BufferedProvider::open_cursors() const {
  std::lock_guard<std::mutex> lk(mu_);
  return cursors_.size();
}

ChunkPtr BufferedProvider::get(std::uint64_t position) {
  std::lock_guard<std::mutex> lk(mu_);
  if (position < next_fetch_) return store_->get(position);
  fetch_until_locked(position);
  return position < next_fetch_ ? store_->get(position) : nullptr;
}

bool BufferedProvider::has(std::uint64_t position) {
  std::lock_guard<std::mutex> lk(mu_);
  // everything below the fetch counter is retained until storage is released
  if (position < next_fetch_) return store_->size() != 0;
  if (exhausted_) return false;
  fetch_until_locked(position);
  return position < next_fetch_;
}

void BufferedProvider::fetch_until_locked(std::uint64_t position) {
  while (next_fetch_ <= position && !exhausted_) {
    const std::size_t limit = store_->limit();
    if (limit != 0 && store_->size() >= limit) {
      throw CapacityExceededError(store_->size(), limit, positions_locked());
    }

    ChunkPtr chunk;
    try {
      chunk = producer_->try_produce();
    } catch (...) {
      exhausted_ = true;
      throw;
    }
    if (!chunk) { exhausted_ = true; break; }

    try {
      store_->put(next_fetch_, std::move(chunk));
    } catch (...) {
      // the store may hold a partial write; nothing past this point is served
      exhausted_ = true;
      throw;
    }
    ++next_fetch_;
    if (producer_->exhausted()) exhausted_ = true;
  }
}

std::vector<CursorPosition> BufferedProvider::positions_locked() const {
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

void BufferedProvider::release_storage_locked() {
  store_->clear();
  producer_.reset();
  exhausted_ = true;
}

void BufferedProvider::seek_slot(detail::CursorSlot& slot, std::int64_t target) {
  std::lock_guard<std::mutex> lk(mu_);
  slot.position.store(static_cast<std::uint64_t>(target), std::memory_order_release);
}

void BufferedProvider::released(detail::CursorSlot& slot) {
  std::lock_guard<std::mutex> lk(mu_);
  cursors_.erase(slot.id);
  if (cursors_.empty() && closed_) release_storage_locked();
}

std::size_t BufferedProvider::stored_chunks() const {
  std::lock_guard<std::mutex> lk(mu_);
  return store_->size();
}

std::uint64_t BufferedProvider::next_fetch_position() const {
  std::lock_guard<std::mutex> lk(mu_);
  return next_fetch_;
}

bool BufferedProvider::source_exhausted() const {
  std::lock_guard<std::mutex> lk(mu_);
  return exhausted_;
}

}
