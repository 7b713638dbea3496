#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/errors.hpp"
#include <utility>

namespace cw {

static ByteSource& checked(const std::unique_ptr<ByteSource>& src) {
  if (!src) throw ConfigError("byte source cannot be null");
  return *src;
}

ChunkProducer::ChunkProducer(std::unique_ptr<ByteSource> src, ChunkReader::Config cfg)
  : src_(std::move(src)), reader_(checked(src_), cfg) {}

ReusingChunkProducer::ReusingChunkProducer(std::unique_ptr<ByteSource> src,
                                           ChunkReader::Config cfg)
  : ChunkProducer(std::move(src), cfg), chunk_(std::make_shared<Chunk>()) {
  chunk_->data_.resize(reader_.chunk_bytes());
}

ChunkPtr ReusingChunkProducer::try_produce() {
  auto info = reader_.read_into(chunk_->data_.data());
  if (!info) return nullptr;
  chunk_->info_ = *info;
  return chunk_;
}

CopyingChunkProducer::CopyingChunkProducer(std::unique_ptr<ByteSource> src,
                                           ChunkReader::Config cfg)
  : ChunkProducer(std::move(src), cfg), scratch_(reader_.chunk_bytes()) {}

ChunkPtr CopyingChunkProducer::try_produce() {
  auto info = reader_.read_into(scratch_.data());
  if (!info) return nullptr;
  std::vector<std::uint8_t> data(scratch_.begin(),
                                 scratch_.begin() + static_cast<std::ptrdiff_t>(info->length));
  return std::make_shared<Chunk>(std::move(data), *info);
}

}
