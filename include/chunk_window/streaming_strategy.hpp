#pragma once
#include "chunk_window/byte_source.hpp"
#include "chunk_window/cursor.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace cw {

enum class StrategyKind { NonRepeatable, InMemory, FileStore, SlidingWindow };

// "non-repeatable" | "in-memory" | "file-store" | "sliding-window"
std::optional<StrategyKind> parse_strategy(std::string_view name);
const char* to_string(StrategyKind k) noexcept;

// Largest chunk a producer will allocate a buffer for.
inline constexpr std::size_t kMaxChunkBytes = std::size_t{1} << 30;

struct StreamingConfig {
  StrategyKind strategy = StrategyKind::NonRepeatable;
  std::size_t chunk_bytes = 1024 * 1024;

  // sliding-window
  std::size_t max_cached_chunks = 3;

  // in-memory; 0 = unbounded
  std::size_t max_buffered_chunks = 1000;

  // file-store
  std::size_t max_in_memory_chunks = 100;
  std::filesystem::path spill_dir;

  // Throws ConfigError naming the first bad field.
  void validate() const;
};

// Chunk the source with the configured strategy. The provider takes the source.
std::unique_ptr<CursorProvider> open_chunked(std::unique_ptr<ByteSource> src,
                                             const StreamingConfig& cfg);

}
