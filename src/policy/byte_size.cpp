#include "chunk_window/byte_size.hpp"
#include <cctype>
#include <charconv>
#include <cmath>
#include <string_view>
#include <fast_float/fast_float.h>

namespace cw {

static std::string_view trim(std::string_view s) {
  while (!s.empty() && std::isspace((unsigned char)s.front())) s.remove_prefix(1);
  while (!s.empty() && std::isspace((unsigned char)s.back())) s.remove_suffix(1);
  return s;
}

static bool ieq(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) if (std::tolower((unsigned char)a[i]) != std::tolower((unsigned char)b[i])) return false;
  return true;
}

static std::optional<double> unit_multiplier(std::string_view u) {
  u = trim(u);
  if (u.empty() || ieq(u, "b")) return 1.0;
  const char head = (char)std::tolower((unsigned char)u.front());
  std::string_view rest = u.substr(1);
  if (!rest.empty() && !ieq(rest, "b") && !ieq(rest, "ib")) return std::nullopt;
  switch (head) {
    case 'k': return 1024.0;
    case 'm': return 1024.0 * 1024.0;
    case 'g': return 1024.0 * 1024.0 * 1024.0;
    default:  return std::nullopt;
  }
}

std::optional<std::uint64_t> parse_byte_size(std::string_view s) {
  s = trim(s);
  if (s.empty() || s.front() == '-' || s.front() == '+') return std::nullopt;

  double mantissa;
  auto [ptr, ec] = fast_float::from_chars(s.data(), s.data() + s.size(), mantissa);
  if (ec != std::errc() || !std::isfinite(mantissa)) return std::nullopt;

  auto mult = unit_multiplier(std::string_view(ptr, (size_t)(s.data() + s.size() - ptr)));
  if (!mult) return std::nullopt;

  const double bytes = std::floor(mantissa * *mult);
  if (bytes < 0.0 || bytes >= 18446744073709551616.0) return std::nullopt;
  return static_cast<std::uint64_t>(bytes);
}

std::optional<std::uint64_t> parse_count(std::string_view s) {
  s = trim(s);
  if (s.empty()) return std::nullopt;
  std::uint64_t out = 0;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), out);
  if (ec != std::errc() || ptr != s.data() + s.size()) return std::nullopt;
  return out;
}

}
