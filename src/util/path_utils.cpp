#include "chunk_window/path_utils.hpp"
#include "chunk_window/digest.hpp"
#include <cctype>
#include <system_error>

namespace cw {

std::filesystem::path join(const std::filesystem::path& a,
                           const std::filesystem::path& b) {
  return std::filesystem::weakly_canonical(a / b);
}

bool ensure_parent_dirs(const std::filesystem::path& p) {
  std::error_code ec;
  auto parent = p.parent_path();
  if (parent.empty()) return true;
  if (std::filesystem::exists(parent, ec)) return true;
  return std::filesystem::create_directories(parent, ec) || !ec;
}

std::string hex_hash_prefix(std::string_view data, int len) {
  auto s = sha256_hex(data);
  if (len >= 0 && (int)s.size() > len) s.resize(len);
  return s;
}

std::string sanitize_slug(std::string_view s) {
  std::string out;
  out.reserve(s.size());
  for (char c : s) {
    const bool ok = std::isalnum((unsigned char)c) || c == '.' || c == '_' || c == '-';
    out.push_back(ok ? c : '-');
  }
  if (out.empty() || out == "." || out == "..") out = "run";
  return out;
}

std::string make_slug(std::string_view key, std::string_view mode, int len) {
  if (len <= 0) len = 12;
  if (mode == "basename") {
    auto base = std::filesystem::path(std::string(key)).filename().string();
    if ((int)base.size() > len) base.resize(len);
    return sanitize_slug(base);
  }
  if (mode == "keypath") {
    auto s = std::string(key);
    for (auto& c : s) if (c=='/' || c=='\\') c='-';
    if ((int)s.size() > len) s.resize(len);
    return sanitize_slug(s);
  }
  // default: hashprefix
  return hex_hash_prefix(key, len);
}

}
