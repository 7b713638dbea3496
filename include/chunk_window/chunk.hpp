#pragma once
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cw {

struct ChunkInfo {
  std::uint64_t index  = 0;
  std::uint64_t offset = 0;  // source byte offset of data()[0]
  std::size_t   length = 0;  // valid bytes, <= capacity()
  bool          first  = false;
  bool          last   = false;
};

// One slice of the source. Always read length() bytes, not capacity():
// a reused buffer keeps its full chunk size on the final short chunk.
class Chunk {
public:
  Chunk() = default;
  Chunk(std::vector<std::uint8_t> data, const ChunkInfo& info)
    : data_(std::move(data)), info_(info) {}

  const std::uint8_t* data() const noexcept { return data_.data(); }
  std::size_t length() const noexcept { return info_.length; }
  std::size_t capacity() const noexcept { return data_.size(); }

  std::uint64_t index() const noexcept { return info_.index; }
  std::uint64_t offset() const noexcept { return info_.offset; }
  bool is_first() const noexcept { return info_.first; }
  bool is_last() const noexcept { return info_.last; }
  const ChunkInfo& info() const noexcept { return info_; }

  std::string_view bytes() const noexcept {
    return std::string_view(reinterpret_cast<const char*>(data_.data()), info_.length);
  }

  std::string to_string() const;

private:
  friend class ReusingChunkProducer;

  std::vector<std::uint8_t> data_;
  ChunkInfo info_;
};

using ChunkPtr = std::shared_ptr<const Chunk>;

}
