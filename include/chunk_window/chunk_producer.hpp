#pragma once
#include "chunk_window/byte_source.hpp"
#include "chunk_window/chunk.hpp"
#include "chunk_window/chunk_reader.hpp"
#include <cstddef>
#include <cstdint>
#include <memory>
#include <vector>

namespace cw {

// Lazily turns one ByteSource into chunks. Not safe for concurrent calls;
// owners serialize try_produce().
class ChunkProducer {
public:
  virtual ~ChunkProducer() = default;

  ChunkProducer(const ChunkProducer&) = delete;
  ChunkProducer& operator=(const ChunkProducer&) = delete;

  // nullptr once the source is drained. Throws SourceIoError (and is then exhausted).
  virtual ChunkPtr try_produce() = 0;

  // True when every returned chunk aliases one reused object.
  virtual bool reuses_storage() const noexcept = 0;

  bool exhausted() const noexcept { return reader_.exhausted(); }
  std::size_t chunk_bytes() const noexcept { return reader_.chunk_bytes(); }
  std::uint64_t chunks_produced() const noexcept { return reader_.chunks_read(); }
  std::uint64_t bytes_produced() const noexcept { return reader_.bytes_read(); }

protected:
  ChunkProducer(std::unique_ptr<ByteSource> src, ChunkReader::Config cfg);

  std::unique_ptr<ByteSource> src_;
  ChunkReader reader_;
};

// Borrowing variant: one buffer and one Chunk for the whole stream.
// The returned chunk is overwritten by the next try_produce().
class ReusingChunkProducer final : public ChunkProducer {
public:
  ReusingChunkProducer(std::unique_ptr<ByteSource> src, ChunkReader::Config cfg);

  ChunkPtr try_produce() override;
  bool reuses_storage() const noexcept override { return true; }

private:
  std::shared_ptr<Chunk> chunk_;
};

// Owning variant: every chunk gets its own exactly-sized buffer and stays
// valid after later pulls. The only producer a retaining cache accepts.
class CopyingChunkProducer final : public ChunkProducer {
public:
  CopyingChunkProducer(std::unique_ptr<ByteSource> src, ChunkReader::Config cfg);

  ChunkPtr try_produce() override;
  bool reuses_storage() const noexcept override { return false; }

private:
  std::vector<std::uint8_t> scratch_;
};

}
