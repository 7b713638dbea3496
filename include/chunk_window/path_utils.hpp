#pragma once
#include <filesystem>
#include <string>
#include <string_view>

namespace cw {

// Join and normalize a/b to an fs::path.
std::filesystem::path join(const std::filesystem::path& a,
                           const std::filesystem::path& b);

// Ensure parent directories exist; returns false on error.
bool ensure_parent_dirs(const std::filesystem::path& p);

// Report directory name for a scanned file: "hashprefix" (default),
// "basename" or "keypath", cut to len characters.
std::string make_slug(std::string_view key, std::string_view mode, int len);

// First len hex digits of SHA-256(data).
std::string hex_hash_prefix(std::string_view data, int len);

// Anything outside [A-Za-z0-9._-] becomes '-'; never empty.
std::string sanitize_slug(std::string_view s);

}
