#pragma once
#include "chunk_window/chunk.hpp"
#include <cstddef>
#include <cstdint>
#include <optional>

namespace cw {

class ByteSource;

// Fills caller buffers with consecutive chunk_bytes slices of a ByteSource and
// decides isLast with a one-byte probe instead of reading ahead a whole chunk.
class ChunkReader {
public:
  struct Config {
    std::size_t chunk_bytes = 1024 * 1024; // 1 MiB
  };

  ChunkReader(ByteSource& src, Config cfg);   // throws ConfigError on chunk_bytes == 0

  // buf must hold chunk_bytes. nullopt once the source is drained.
  // Throws SourceIoError; the reader is exhausted afterwards.
  std::optional<ChunkInfo> read_into(std::uint8_t* buf);

  bool exhausted() const noexcept { return exhausted_; }
  std::size_t chunk_bytes() const noexcept { return cfg_.chunk_bytes; }
  std::uint64_t chunks_read() const noexcept { return index_; }
  std::uint64_t bytes_read() const noexcept { return offset_; }

private:
  std::size_t fill(std::uint8_t* buf);
  bool probe_eof();

  ByteSource& src_;
  Config cfg_;
  std::uint64_t index_{0};
  std::uint64_t offset_{0};
  bool exhausted_{false};
};

}
