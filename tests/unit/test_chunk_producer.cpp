#include "chunk_window/byte_source.hpp"
#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/errors.hpp"
#include <cstring>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

static int fails = 0;
static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

// Hands out `good` bytes of 'x', then fails like a broken pipe.
class FailingSource : public cw::ByteSource {
public:
  explicit FailingSource(std::size_t good) : good_(good) {}
protected:
  std::size_t read_some(std::uint8_t* dst, std::size_t n) override {
    if (good_ == 0) throw cw::SourceIoError("simulated read failure", 5);
    std::size_t take = n < good_ ? n : good_;
    std::memset(dst, 'x', take);
    good_ -= take;
    return take;
  }
private:
  std::size_t good_;
};

int main(){
  const std::string body = "0123456789abcdefghijklmnopqrstuvwxyz";   // 36 bytes

  // reuse mode: one object, full-size buffer, last chunk shorter than capacity
  {
    cw::ReusingChunkProducer p(std::make_unique<cw::MemoryByteSource>(body), {16});
    auto a = p.try_produce();
    const std::uint8_t* buf = a ? a->data() : nullptr;
    check(a && a->bytes() == "0123456789abcdef", "reuse first chunk content");
    auto b = p.try_produce();
    check(b.get() == a.get() && b->data() == buf, "reuse returns the same object and buffer");
    check(a->bytes() == "ghijklmnopqrstuv", "earlier handle sees the overwritten bytes");
    auto c = p.try_produce();
    check(c.get() == a.get() && c->length() == 4 && c->capacity() == 16 && c->is_last(),
          "reuse last chunk keeps capacity 16 with length 4");
    check(!p.try_produce() && !p.try_produce(), "reuse stays drained");
    check(p.reuses_storage(), "reuse reports reuses_storage");
  }

  // copy mode: distinct objects that stay valid
  {
    cw::CopyingChunkProducer p(std::make_unique<cw::MemoryByteSource>(body), {16});
    auto a = p.try_produce();
    auto b = p.try_produce();
    auto c = p.try_produce();
    check(a && b && c && a.get() != b.get() && b.get() != c.get(), "copy returns distinct chunks");
    check(a->bytes() == "0123456789abcdef" && b->bytes() == "ghijklmnopqrstuv" && c->bytes() == "wxyz",
          "copied chunks keep their own bytes");
    check(c->capacity() == 4, "copied last chunk is exactly sized");
    check(!p.try_produce(), "copy drained");
    check(!p.reuses_storage() && p.chunks_produced() == 3 && p.bytes_produced() == 36,
          "copy counters");
  }

  // read failure surfaces as SourceIoError and exhausts the producer
  {
    cw::CopyingChunkProducer p(std::make_unique<FailingSource>(20), {16});
    auto first = p.try_produce();
    check(first && first->length() == 16 && !first->is_last(), "chunk before the failure");
    bool threw = false;
    try {
      p.try_produce();
    } catch (const cw::SourceIoError& e) {
      threw = e.sys_errno() == 5 && e.kind() == cw::ErrorKind::ReadError;
    }
    check(threw, "read failure raises SourceIoError");
    check(p.exhausted() && !p.try_produce(), "producer exhausted after a read failure");
  }

  // null source
  {
    bool threw = false;
    try {
      cw::CopyingChunkProducer p(nullptr, {16});
    } catch (const cw::ConfigError&) { threw = true; }
    check(threw, "null source rejected");
  }

  if (fails) return 1;
  std::cout << "[PASS] chunk producer\n";
  return 0;
}
