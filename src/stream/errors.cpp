#include "chunk_window/errors.hpp"
#include <sstream>
#include <utility>

namespace cw {

std::string_view to_string(ErrorKind k) noexcept {
  switch (k) {
    case ErrorKind::InvalidConfig:    return "INVALID_CONFIG";
    case ErrorKind::ReadError:        return "READ_ERROR";
    case ErrorKind::CapacityExceeded: return "CAPACITY_EXCEEDED";
    case ErrorKind::EvictedPosition:  return "EVICTED_POSITION";
    case ErrorKind::InvalidSeek:      return "INVALID_SEEK";
    case ErrorKind::CursorReleased:   return "CURSOR_RELEASED";
    case ErrorKind::NoSuchChunk:      return "NO_SUCH_CHUNK";
    case ErrorKind::ProviderClosed:   return "PROVIDER_CLOSED";
    case ErrorKind::SinglePass:       return "SINGLE_PASS";
  }
  return "UNKNOWN";
}

static std::string overflow_message(std::size_t cache_size, std::size_t capacity,
                                    const std::vector<CursorPosition>& cursors) {
  std::ostringstream o;
  o << "chunk cache exceeded maximum size. cache size: " << cache_size
    << ", capacity: " << capacity
    << ", active cursors: " << cursors.size() << ". cursor positions: [";
  for (size_t i = 0; i < cursors.size(); ++i) {
    if (i) o << ", ";
    if (!cursors[i].label.empty()) o << cursors[i].label << "=";
    o << cursors[i].position;
    if (!cursors[i].eligible) o << "(ineligible)";
  }
  o << "]. increase the capacity or use a different streaming strategy";
  return o.str();
}

CapacityExceededError::CapacityExceededError(std::size_t cache_size, std::size_t capacity,
                                             std::vector<CursorPosition> cursors)
  : ChunkWindowError(ErrorKind::CapacityExceeded,
                     overflow_message(cache_size, capacity, cursors)),
    cache_size_(cache_size), capacity_(capacity), cursors_(std::move(cursors)) {}

EvictedPositionError::EvictedPositionError(std::uint64_t requested, std::uint64_t min_retained)
  : ChunkWindowError(ErrorKind::EvictedPosition,
                     "cannot seek to position " + std::to_string(requested) +
                     ": data has been evicted from the window, minimum available position is " +
                     std::to_string(min_retained)),
    requested_(requested), min_retained_(min_retained) {}

}
