#include "chunk_window/byte_source.hpp"
#include "chunk_window/chunk_producer.hpp"
#include "chunk_window/errors.hpp"
#include "chunk_window/window_cache.hpp"
#include <atomic>
#include <iostream>
#include <memory>
#include <string>
#include <thread>
#include <vector>

// Consumers race over one window; the ones that run ahead back off on overflow.
int main(){
  constexpr std::size_t kChunks = 500;
  constexpr std::size_t kChunkBytes = 8;
  constexpr std::size_t kCapacity = 4;
  constexpr int kThreads = 4;

  std::string body;
  for (std::size_t i = 0; i < kChunks; ++i) body.append(kChunkBytes, static_cast<char>('A' + i % 26));

  auto prod = std::make_unique<cw::CopyingChunkProducer>(
      std::make_unique<cw::MemoryByteSource>(body), cw::ChunkReader::Config{kChunkBytes});
  cw::SlidingWindowCache cache(std::move(prod), cw::SlidingWindowCache::Config{kCapacity});

  std::vector<std::unique_ptr<cw::Cursor>> cursors;
  for (int t = 0; t < kThreads; ++t) {
    cw::CursorOptions o;
    o.label = "t" + std::to_string(t);
    cursors.push_back(cache.open_cursor(o));
  }

  std::atomic<int> violations{0};
  std::atomic<int> errors{0};
  std::vector<std::size_t> counts(kThreads, 0);
  std::vector<std::thread> threads;

  for (int t = 0; t < kThreads; ++t) {
    threads.emplace_back([&, t] {
      cw::Cursor& cur = *cursors[t];
      std::size_t expect = 0;
      for (;;) {
        try {
          if (!cur.has_next()) break;
          auto c = cur.next();
          const bool ok = c->index() == expect && c->length() == kChunkBytes &&
                          c->bytes()[0] == static_cast<char>('A' + expect % 26);
          if (!ok) { ++errors; break; }
          ++expect;

          const auto min_retained = cache.min_retained_position();
          if (min_retained > cur.position()) ++violations;
          if (cache.cached_chunks() > kCapacity) ++violations;
        } catch (const cw::CapacityExceededError&) {
          std::this_thread::yield();
        } catch (const cw::ChunkWindowError& e) {
          std::cerr << "[ERR] " << e.what() << "\n";
          ++errors;
          break;
        }
      }
      counts[t] = expect;
      cur.release();
    });
  }
  for (auto& th : threads) th.join();

  bool ok = true;
  for (int t = 0; t < kThreads; ++t) {
    if (counts[t] != kChunks) {
      std::cerr << "[FAIL] thread " << t << " read " << counts[t] << " chunks\n";
      ok = false;
    }
  }
  if (errors) { std::cerr << "[FAIL] " << errors << " out-of-order or failed reads\n"; ok = false; }
  if (violations) { std::cerr << "[FAIL] " << violations << " window invariant violations\n"; ok = false; }

  auto st = cache.stats();
  if (st.fetched != kChunks) { std::cerr << "[FAIL] fetched " << st.fetched << " chunks\n"; ok = false; }
  if (st.high_water > kCapacity) { std::cerr << "[FAIL] high water " << st.high_water << "\n"; ok = false; }
  if (cache.cached_chunks() != 0) { std::cerr << "[FAIL] entries left after all released\n"; ok = false; }

  if (!ok) return 1;
  std::cout << "[PASS] " << kThreads << " cursors x " << kChunks << " chunks, overflows="
            << st.overflows << " evicted=" << st.evicted << "\n";
  return 0;
}
