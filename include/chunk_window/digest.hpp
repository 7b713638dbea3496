#pragma once
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

namespace cw {

// Incremental SHA-256 over OpenSSL EVP. Throws std::runtime_error if the
// digest context cannot be set up.
class Sha256 {
public:
  Sha256();
  ~Sha256();

  Sha256(const Sha256&) = delete;
  Sha256& operator=(const Sha256&) = delete;

  void update(const std::uint8_t* data, std::size_t n);
  void update(std::string_view s) { update(reinterpret_cast<const std::uint8_t*>(s.data()), s.size()); }

  // Lowercase hex of everything fed so far. Finalizes; a later update() starts over.
  std::string hex();

private:
  void reset();

  void* ctx_{nullptr};   // EVP_MD_CTX
};

std::string sha256_hex(std::string_view data);

}
