#pragma once

#include <array>
#include <string_view>

namespace vigil::util {

namespace detail {
constexpr std::array<unsigned char, 256> make_lower_table() {
  std::array<unsigned char, 256> t{};
  for (int c = 0; c < 256; ++c) {
    t[static_cast<size_t>(c)] = static_cast<unsigned char>((c >= 'A' && c <= 'Z') ? c + ('a' - 'A') : c);
  }
  return t;
}
inline constexpr auto kLowerTable = make_lower_table();
} // namespace detail

// Locale-independent ASCII lowercase; bytes >= 0x80 pass through unchanged.
constexpr unsigned char ascii_lower(unsigned char c) { return detail::kLowerTable[c]; }

inline bool ascii_iequals(std::string_view a, std::string_view b) {
  if (a.size() != b.size()) return false;
  for (size_t i = 0; i < a.size(); ++i) {
    if (ascii_lower(static_cast<unsigned char>(a[i])) != ascii_lower(static_cast<unsigned char>(b[i]))) return false;
  }
  return true;
}

// Three-way case-insensitive compare (<0, 0, >0).
inline int ascii_icompare(std::string_view a, std::string_view b) {
  size_t n = a.size() < b.size() ? a.size() : b.size();
  for (size_t i = 0; i < n; ++i) {
    unsigned char ca = ascii_lower(static_cast<unsigned char>(a[i]));
    unsigned char cb = ascii_lower(static_cast<unsigned char>(b[i]));
    if (ca != cb) return ca < cb ? -1 : 1;
  }
  if (a.size() == b.size()) return 0;
  return a.size() < b.size() ? -1 : 1;
}

} // namespace vigil::util
