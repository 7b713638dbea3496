#include "chunk_window/streaming_strategy.hpp"
#include "chunk_window/buffered_provider.hpp"
#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/errors.hpp"
#include "chunk_window/single_pass_stream.hpp"
#include "chunk_window/window_cache.hpp"
#include <string>
#include <utility>

namespace cw {

std::optional<StrategyKind> parse_strategy(std::string_view name) {
  if (name == "non-repeatable") return StrategyKind::NonRepeatable;
  if (name == "in-memory")      return StrategyKind::InMemory;
  if (name == "file-store")     return StrategyKind::FileStore;
  if (name == "sliding-window") return StrategyKind::SlidingWindow;
  return std::nullopt;
}

const char* to_string(StrategyKind k) noexcept {
  switch (k) {
    case StrategyKind::NonRepeatable: return "non-repeatable";
    case StrategyKind::InMemory:      return "in-memory";
    case StrategyKind::FileStore:     return "file-store";
    case StrategyKind::SlidingWindow: return "sliding-window";
  }
  return "unknown";
}

void StreamingConfig::validate() const {
  if (chunk_bytes == 0) throw ConfigError("chunk size must be positive: 0");
  if (chunk_bytes > kMaxChunkBytes) {
    throw ConfigError("chunk size " + std::to_string(chunk_bytes) + " exceeds the maximum of " +
                      std::to_string(kMaxChunkBytes) + " bytes");
  }
  if (strategy == StrategyKind::SlidingWindow && max_cached_chunks == 0)
    throw ConfigError("max cached chunks must be positive: 0");
  if (strategy == StrategyKind::FileStore && max_in_memory_chunks == 0)
    throw ConfigError("max in-memory chunks must be positive: 0");
}

std::unique_ptr<CursorProvider> open_chunked(std::unique_ptr<ByteSource> src,
                                             const StreamingConfig& cfg) {
  cfg.validate();
  ChunkReader::Config rc;
  rc.chunk_bytes = cfg.chunk_bytes;

  switch (cfg.strategy) {
    case StrategyKind::NonRepeatable:
      return std::make_unique<SinglePassStream>(
          std::make_unique<ReusingChunkProducer>(std::move(src), rc));

    case StrategyKind::InMemory:
      return std::make_unique<BufferedProvider>(
          std::make_unique<CopyingChunkProducer>(std::move(src), rc),
          std::make_unique<MemoryChunkStore>(cfg.max_buffered_chunks));

    case StrategyKind::FileStore: {
      SpillChunkStore::Config sc;
      sc.max_in_memory_chunks = cfg.max_in_memory_chunks;
      sc.spill_dir = cfg.spill_dir;
      return std::make_unique<BufferedProvider>(
          std::make_unique<CopyingChunkProducer>(std::move(src), rc),
          std::make_unique<SpillChunkStore>(sc));
    }

    case StrategyKind::SlidingWindow: {
      SlidingWindowCache::Config wc;
      wc.max_cached_chunks = cfg.max_cached_chunks;
      return std::make_unique<SlidingWindowCache>(
          std::make_unique<CopyingChunkProducer>(std::move(src), rc), wc);
    }
  }
  throw ConfigError("unknown streaming strategy");
}

}
