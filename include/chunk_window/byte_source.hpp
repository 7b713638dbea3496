#pragma once
#include <cstddef>
#include <cstdint>
#include <cstdio>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cw {

// Forward-only byte stream with room for one pushed-back byte.
// Never seeks or rewinds the underlying stream.
class ByteSource {
public:
  virtual ~ByteSource() = default;

  // Up to n bytes into dst; 0 means end of stream. Throws SourceIoError.
  std::size_t read(std::uint8_t* dst, std::size_t n);

  // Next byte, or -1 at end of stream.
  int read_byte();

  // Re-deliver b as the next byte read. One slot only.
  void unread(std::uint8_t b);

  virtual void close() {}

protected:
  virtual std::size_t read_some(std::uint8_t* dst, std::size_t n) = 0;

private:
  std::optional<std::uint8_t> pushback_;
};

// stdio-backed source; path "-" reads stdin.
class FileByteSource : public ByteSource {
public:
  explicit FileByteSource(std::string path);   // throws SourceIoError if open fails
  ~FileByteSource() override;

  FileByteSource(const FileByteSource&) = delete;
  FileByteSource& operator=(const FileByteSource&) = delete;

  void close() override;
  const std::string& path() const noexcept { return path_; }

protected:
  std::size_t read_some(std::uint8_t* dst, std::size_t n) override;

private:
  std::string path_;
  std::FILE* f_{nullptr};
  bool owns_{true};
};

class MemoryByteSource : public ByteSource {
public:
  explicit MemoryByteSource(std::vector<std::uint8_t> bytes, std::size_t max_read = 0);
  explicit MemoryByteSource(std::string_view bytes, std::size_t max_read = 0);

  std::size_t remaining() const noexcept { return bytes_.size() - pos_; }

protected:
  // max_read > 0 caps every call, which models a pipe handing back short reads.
  std::size_t read_some(std::uint8_t* dst, std::size_t n) override;

private:
  std::vector<std::uint8_t> bytes_;
  std::size_t pos_{0};
  std::size_t max_read_{0};
};

}
