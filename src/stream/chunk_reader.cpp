#include "chunk_window/chunk_reader.hpp"
#include "chunk_window/byte_source.hpp"
#include "chunk_window/errors.hpp"
#include <sstream>

namespace cw {

std::string Chunk::to_string() const {
  std::ostringstream o;
  o << "Chunk[index=" << info_.index << ", offset=" << info_.offset
    << ", length=" << info_.length << ", isFirst=" << (info_.first ? "true" : "false")
    << ", isLast=" << (info_.last ? "true" : "false") << "]";
  return o.str();
}

ChunkReader::ChunkReader(ByteSource& src, Config cfg) : src_(src), cfg_(cfg) {
  if (cfg_.chunk_bytes == 0) throw ConfigError("chunk size must be positive: 0");
}

std::size_t ChunkReader::fill(std::uint8_t* buf) {
  std::size_t total = 0;
  while (total < cfg_.chunk_bytes) {
    std::size_t n = src_.read(buf + total, cfg_.chunk_bytes - total);
    if (n == 0) break;
    total += n;
  }
  return total;
}

bool ChunkReader::probe_eof() {
  int b = src_.read_byte();
  if (b < 0) return true;
  src_.unread(static_cast<std::uint8_t>(b));
  return false;
}

std::optional<ChunkInfo> ChunkReader::read_into(std::uint8_t* buf) {
  if (exhausted_) return std::nullopt;

  try {
    const std::size_t n = fill(buf);
    if (n == 0) { exhausted_ = true; return std::nullopt; }

    bool last;
    if (n < cfg_.chunk_bytes) {
      // short read is unconditionally the tail
      last = true;
    } else {
      last = probe_eof();
    }
    if (last) exhausted_ = true;

    ChunkInfo info;
    info.index  = index_;
    info.offset = offset_;
    info.length = n;
    info.first  = (index_ == 0);
    info.last   = last;

    ++index_;
    offset_ += n;
    return info;
  } catch (...) {
    exhausted_ = true;
    throw;
  }
}

}
