#include "chunk_window/digest.hpp"
#include <stdexcept>
#include <openssl/evp.h>

namespace cw {

static EVP_MD_CTX* as_ctx(void* p) { return static_cast<EVP_MD_CTX*>(p); }

Sha256::Sha256() {
  ctx_ = EVP_MD_CTX_new();
  if (!ctx_) throw std::runtime_error("EVP_MD_CTX_new failed");
  if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha256(), nullptr) != 1) {
    EVP_MD_CTX_free(as_ctx(ctx_));
    ctx_ = nullptr;
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
  }
}

Sha256::~Sha256() { EVP_MD_CTX_free(as_ctx(ctx_)); }

void Sha256::reset() {
  if (EVP_DigestInit_ex(as_ctx(ctx_), EVP_sha256(), nullptr) != 1)
    throw std::runtime_error("EVP_DigestInit_ex(sha256) failed");
}

void Sha256::update(const std::uint8_t* data, std::size_t n) {
  if (n == 0) return;
  if (EVP_DigestUpdate(as_ctx(ctx_), data, n) != 1)
    throw std::runtime_error("EVP_DigestUpdate failed");
}

std::string Sha256::hex() {
  unsigned char md[EVP_MAX_MD_SIZE];
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(as_ctx(ctx_), md, &len) != 1)
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  reset();

  static const char digits[] = "0123456789abcdef";
  std::string out;
  out.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    out.push_back(digits[md[i] >> 4]);
    out.push_back(digits[md[i] & 0x0f]);
  }
  return out;
}

std::string sha256_hex(std::string_view data) {
  Sha256 h;
  h.update(data);
  return h.hex();
}

}
