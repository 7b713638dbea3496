#include <chrono>
#include <cstdint>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

#include "chunk_window/byte_size.hpp"
#include "chunk_window/byte_source.hpp"
#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/errors.hpp"
#include "chunk_window/single_pass_stream.hpp"
#include "chunk_window/window_cache.hpp"

using clk = std::chrono::steady_clock;

static std::vector<std::uint8_t> make_bytes(std::size_t n) {
  std::vector<std::uint8_t> v(n);
  std::uint64_t x = 88172645463325252ull;
  for (auto& b : v) { x ^= x << 13; x ^= x >> 7; x ^= x << 17; b = static_cast<std::uint8_t>(x); }
  return v;
}

static void bench_single_pass(const std::vector<std::uint8_t>& data, std::size_t chunk, int iters) {
  std::cout << "\n[single-pass] bytes=" << data.size() << " chunk=" << chunk << "\n";
  for (int k=1;k<=iters;++k) {
    cw::SinglePassStream s(std::make_unique<cw::ReusingChunkProducer>(
        std::make_unique<cw::MemoryByteSource>(data), cw::ChunkReader::Config{chunk}));
    auto cur = s.open_cursor();
    std::uint64_t sum = 0;
    auto t0 = clk::now();
    while (cur->has_next()) sum += cur->next()->length();
    auto t1 = clk::now();
    double sec = std::chrono::duration<double>(t1-t0).count();
    std::cout << "  iter " << k << ": bytes=" << sum
              << " time=" << sec << "s  rate=" << (sum/(1024.0*1024.0))/sec << " MB/s\n";
  }
}

static void bench_window(const std::vector<std::uint8_t>& data, std::size_t chunk,
                         std::size_t cap, int cursors, int iters) {
  std::cout << "\n[sliding-window] bytes=" << data.size() << " chunk=" << chunk
            << " capacity=" << cap << " cursors=" << cursors << "\n";
  for (int k=1;k<=iters;++k) {
    cw::SlidingWindowCache cache(std::make_unique<cw::CopyingChunkProducer>(
        std::make_unique<cw::MemoryByteSource>(data), cw::ChunkReader::Config{chunk}),
        cw::SlidingWindowCache::Config{cap});
    std::vector<std::unique_ptr<cw::Cursor>> curs;
    for (int i=0;i<cursors;++i) curs.push_back(cache.open_cursor());

    std::vector<std::uint64_t> sums(cursors, 0);
    std::vector<std::thread> th;
    auto t0 = clk::now();
    for (int i=0;i<cursors;++i) {
      th.emplace_back([&, i]{
        for (;;) {
          try {
            if (!curs[i]->has_next()) break;
            sums[i] += curs[i]->next()->length();
          } catch (const cw::CapacityExceededError&) {
            std::this_thread::yield();   // ahead of the window; let the others catch up
          }
        }
        curs[i]->release();
      });
    }
    for (auto& t : th) t.join();
    auto t1 = clk::now();
    double sec = std::chrono::duration<double>(t1-t0).count();
    auto st = cache.stats();
    std::cout << "  iter " << k << ": bytes/cursor=" << sums[0]
              << " time=" << sec << "s  rate=" << (sums[0]/(1024.0*1024.0))/sec << " MB/s"
              << "  hits=" << st.hits << " misses=" << st.misses << " evicted=" << st.evicted
              << " high_water=" << st.high_water << " overflows=" << st.overflows << "\n";
  }
}

int main(int argc, char** argv){
  std::uint64_t bytes = 256ull * 1024 * 1024;
  std::uint64_t chunk = 64 * 1024;
  std::size_t cap = 8;
  int cursors = 4;
  int iters = 3;
  for (int i=1;i<argc;++i){
    std::string s(argv[i]);
    auto eq = s.find('=');
    auto k = s.substr(0,eq); auto v = (eq==std::string::npos)?"":s.substr(eq+1);
    if (k=="--bytes") bytes = cw::parse_byte_size(v).value_or(bytes);
    else if (k=="--chunk") chunk = cw::parse_byte_size(v).value_or(chunk);
    else if (k=="--capacity") cap = std::stoul(v);
    else if (k=="--cursors") cursors = std::stoi(v);
    else if (k=="--iters") iters = std::stoi(v);
    else if (k=="--help"||k=="-h"){
      std::cout << "Usage: cw_bench_window [--bytes=256MiB] [--chunk=64KiB] [--capacity=8] [--cursors=4] [--iters=3]\n";
      return 0;
    }
  }
  if (chunk == 0 || cap == 0 || cursors < 1) {
    std::cerr << "chunk, capacity and cursors must be positive\n";
    return 1;
  }
  auto data = make_bytes(bytes);
  bench_single_pass(data, chunk, iters);
  bench_window(data, chunk, cap, cursors, iters);
  return 0;
}
