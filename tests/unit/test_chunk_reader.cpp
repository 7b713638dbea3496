#include "chunk_window/byte_source.hpp"
#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/errors.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

namespace fs = std::filesystem;

static int fails = 0;
static void check(bool ok, const std::string& what) {
  if (!ok) { std::cerr << "[FAIL] " << what << "\n"; ++fails; }
}

static std::string pattern(std::size_t n) {
  std::string s(n, '\0');
  for (std::size_t i = 0; i < n; ++i) s[i] = static_cast<char>('a' + (i * 7) % 26);
  return s;
}

static std::vector<cw::ChunkInfo> drain(std::string_view bytes, std::size_t chunk, std::size_t max_read = 0) {
  cw::CopyingChunkProducer p(std::make_unique<cw::MemoryByteSource>(bytes, max_read), {chunk});
  std::vector<cw::ChunkInfo> out;
  while (auto c = p.try_produce()) out.push_back(c->info());
  return out;
}

int main(){
  // 150 bytes in 64-byte chunks
  {
    auto v = drain(pattern(150), 64);
    check(v.size() == 3, "150/64 should give 3 chunks");
    if (v.size() == 3) {
      check(v[0].length == 64 && v[1].length == 64 && v[2].length == 22, "150/64 lengths 64,64,22");
      check(v[0].first && !v[1].first && !v[2].first, "150/64 first flags");
      check(!v[0].last && !v[1].last && v[2].last, "150/64 last flags");
      check(v[0].offset == 0 && v[1].offset == 64 && v[2].offset == 128, "150/64 offsets");
    }
  }

  // exact multiple: the probe marks the second chunk last, no empty tail
  {
    auto v = drain(pattern(128), 64);
    check(v.size() == 2, "128/64 should give 2 chunks");
    if (v.size() == 2) check(!v[0].last && v[1].last && v[1].length == 64, "128/64 last chunk full and last");
  }

  // empty source
  check(drain("", 64).empty(), "empty source yields no chunks");

  // counts, lengths, offsets and flags across sizes, also with short reads
  for (std::size_t c : {1u, 3u, 64u}) {
    for (std::size_t len = 0; len <= 200; len += 7) {
      for (std::size_t max_read : {0u, 5u}) {
        auto v = drain(pattern(len), c, max_read);
        const std::size_t want = (len + c - 1) / c;
        std::size_t sum = 0, lasts = 0;
        bool offsets_ok = true;
        for (std::size_t i = 0; i < v.size(); ++i) {
          sum += v[i].length;
          lasts += v[i].last ? 1 : 0;
          offsets_ok &= v[i].offset == i * c && v[i].index == i && v[i].first == (i == 0);
        }
        const std::string tag = " (len=" + std::to_string(len) + " c=" + std::to_string(c) +
                                " max_read=" + std::to_string(max_read) + ")";
        check(v.size() == want, "chunk count" + tag);
        check(sum == len, "lengths sum to source size" + tag);
        check(offsets_ok, "index/offset/first sequence" + tag);
        check(len == 0 ? lasts == 0 : (lasts == 1 && v.back().last), "exactly one last chunk" + tag);
      }
    }
  }

  // chunk size 0
  {
    bool threw = false;
    try {
      cw::CopyingChunkProducer p(std::make_unique<cw::MemoryByteSource>("abc"), {0});
    } catch (const cw::ConfigError&) { threw = true; }
    check(threw, "chunk size 0 rejected with ConfigError");
  }

  // file source round trip
  {
    const fs::path f = fs::temp_directory_path() / "cw_test_chunk_reader.bin";
    const std::string body = pattern(1000);
    { std::ofstream out(f, std::ios::binary); out << body; }
    cw::CopyingChunkProducer p(std::make_unique<cw::FileByteSource>(f.string()), {256});
    std::string seen;
    std::size_t n = 0;
    while (auto c = p.try_produce()) { seen.append(c->bytes()); ++n; }
    check(n == 4 && seen == body, "file source reproduces the file in 4 chunks");
    check(p.exhausted() && p.bytes_produced() == 1000, "file producer exhausted after 1000 bytes");
    fs::remove(f);
  }

  // missing file
  {
    bool threw = false;
    try {
      cw::FileByteSource src("/nonexistent/cw/definitely-missing.bin");
    } catch (const cw::SourceIoError& e) {
      threw = e.kind() == cw::ErrorKind::ReadError;
    }
    check(threw, "missing file raises SourceIoError");
  }

  if (fails) return 1;
  std::cout << "[PASS] chunk reader\n";
  return 0;
}
