#include "chunk_window/byte_source.hpp"
#include "chunk_window/errors.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <stdexcept>
#include <utility>

namespace cw {

std::size_t ByteSource::read(std::uint8_t* dst, std::size_t n) {
  if (n == 0) return 0;
  if (pushback_) {
    dst[0] = *pushback_;
    pushback_.reset();
    return 1;
  }
  return read_some(dst, n);
}

int ByteSource::read_byte() {
  std::uint8_t b = 0;
  return read(&b, 1) == 1 ? static_cast<int>(b) : -1;
}

void ByteSource::unread(std::uint8_t b) {
  if (pushback_) throw std::logic_error("pushback slot already occupied");
  pushback_ = b;
}

FileByteSource::FileByteSource(std::string path) : path_(std::move(path)) {
  if (path_ == "-") {
    f_ = stdin;
    owns_ = false;
    return;
  }
  f_ = std::fopen(path_.c_str(), "rb");
  if (!f_) {
    const int e = errno;
    throw SourceIoError("open failed: " + path_ + " (" + std::strerror(e) + ")", e);
  }
}

FileByteSource::~FileByteSource() { close(); }

void FileByteSource::close() {
  if (f_ && owns_) std::fclose(f_);
  f_ = nullptr;
}

std::size_t FileByteSource::read_some(std::uint8_t* dst, std::size_t n) {
  if (!f_) return 0;
  std::size_t got = std::fread(dst, 1, n, f_);
  if (got == 0 && std::ferror(f_)) {
    const int e = errno;
    throw SourceIoError("read failed: " + path_ + " (" + std::strerror(e) + ")", e);
  }
  return got;
}

MemoryByteSource::MemoryByteSource(std::vector<std::uint8_t> bytes, std::size_t max_read)
  : bytes_(std::move(bytes)), max_read_(max_read) {}

MemoryByteSource::MemoryByteSource(std::string_view bytes, std::size_t max_read)
  : bytes_(bytes.begin(), bytes.end()), max_read_(max_read) {}

std::size_t MemoryByteSource::read_some(std::uint8_t* dst, std::size_t n) {
  std::size_t take = std::min(n, bytes_.size() - pos_);
  if (max_read_ > 0) take = std::min(take, max_read_);
  if (take == 0) return 0;
  std::memcpy(dst, bytes_.data() + pos_, take);
  pos_ += take;
  return take;
}

}
