#pragma once
#include <cstddef>
#include <cstdint>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace cw {

enum class ErrorKind {
  InvalidConfig,
  ReadError,
  CapacityExceeded,
  EvictedPosition,
  InvalidSeek,
  CursorReleased,
  NoSuchChunk,
  ProviderClosed,
  SinglePass
};

// Stable upper-snake name, e.g. "CAPACITY_EXCEEDED".
std::string_view to_string(ErrorKind k) noexcept;

class ChunkWindowError : public std::runtime_error {
public:
  ChunkWindowError(ErrorKind kind, const std::string& what)
    : std::runtime_error(what), kind_(kind) {}

  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

// Non-positive chunk size or capacity, unknown strategy, bad config file.
class ConfigError : public ChunkWindowError {
public:
  explicit ConfigError(const std::string& what)
    : ChunkWindowError(ErrorKind::InvalidConfig, what) {}
};

// Source read failure. The producer is exhausted once this is thrown.
class SourceIoError : public ChunkWindowError {
public:
  SourceIoError(const std::string& what, int sys_errno = 0)
    : ChunkWindowError(ErrorKind::ReadError, what), errno_(sys_errno) {}

  int sys_errno() const noexcept { return errno_; }

private:
  int errno_;
};

struct CursorPosition {
  std::uint64_t id = 0;
  std::string   label;
  std::uint64_t position = 0;
  bool          eligible = true;
};

// The window cannot admit another chunk. Carries enough state for the caller
// to decide between raising the capacity and re-balancing consumers.
class CapacityExceededError : public ChunkWindowError {
public:
  CapacityExceededError(std::size_t cache_size, std::size_t capacity,
                        std::vector<CursorPosition> cursors);

  std::size_t cache_size() const noexcept { return cache_size_; }
  std::size_t capacity() const noexcept { return capacity_; }
  std::size_t cursor_count() const noexcept { return cursors_.size(); }
  const std::vector<CursorPosition>& cursors() const noexcept { return cursors_; }

private:
  std::size_t cache_size_;
  std::size_t capacity_;
  std::vector<CursorPosition> cursors_;
};

class EvictedPositionError : public ChunkWindowError {
public:
  EvictedPositionError(std::uint64_t requested, std::uint64_t min_retained);

  std::uint64_t requested() const noexcept { return requested_; }
  std::uint64_t min_retained() const noexcept { return min_retained_; }

private:
  std::uint64_t requested_;
  std::uint64_t min_retained_;
};

class CursorReleasedError : public ChunkWindowError {
public:
  explicit CursorReleasedError(const std::string& op)
    : ChunkWindowError(ErrorKind::CursorReleased, "cannot " + op + " on released cursor") {}
};

class NoSuchChunkError : public ChunkWindowError {
public:
  explicit NoSuchChunkError(std::uint64_t position)
    : ChunkWindowError(ErrorKind::NoSuchChunk,
                       "no chunk at position " + std::to_string(position)),
      position_(position) {}

  std::uint64_t position() const noexcept { return position_; }

private:
  std::uint64_t position_;
};

class ProviderClosedError : public ChunkWindowError {
public:
  ProviderClosedError()
    : ChunkWindowError(ErrorKind::ProviderClosed, "cannot open cursor on closed provider") {}
};

}
