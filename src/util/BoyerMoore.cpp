#include "util/BoyerMoore.hpp"
#include "util/AsciiLower.hpp"

namespace vigil::util {

static bool is_word_char(unsigned char c) {
  return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '_';
}

BoyerMooreSearch::BoyerMooreSearch(std::string_view pattern, bool ignore_case)
    : pattern_(pattern), ignore_case_(ignore_case) {
  compute_shift();
}

unsigned char BoyerMooreSearch::fold(char c) const {
  auto u = static_cast<unsigned char>(c);
  return ignore_case_ ? ascii_lower(u) : u;
}

void BoyerMooreSearch::compute_shift() {
  const size_t m = pattern_.size();
  for (auto& s : shift_) s = m;
  if (m == 0) return;
  // Every pattern byte except the last gets its distance from the end
  for (size_t i = 0; i + 1 < m; ++i) {
    unsigned char c = fold(pattern_[i]);
    shift_[c] = m - 1 - i;
    if (ignore_case_ && c >= 'a' && c <= 'z') shift_[c - 'a' + 'A'] = m - 1 - i;
  }
}

size_t BoyerMooreSearch::search(std::string_view text, size_t from) const {
  const size_t n = text.size();
  const size_t m = pattern_.size();
  if (from > n) return npos;
  if (m == 0) return from;
  if (m > n - from) return npos;

  size_t i = from;
  while (i <= n - m) {
    size_t j = m;
    while (j > 0 && fold(text[i + j - 1]) == fold(pattern_[j - 1])) --j;
    if (j == 0) return i;
    size_t s = shift_[static_cast<unsigned char>(text[i + m - 1])];
    i += s > 0 ? s : 1;
  }
  return npos;
}

bool BoyerMooreSearch::contains_word(std::string_view text) const {
  const size_t m = pattern_.size();
  if (m == 0) return true;
  size_t pos = search(text);
  while (pos != npos) {
    bool left_ok = pos == 0 || !is_word_char(static_cast<unsigned char>(text[pos - 1]));
    bool right_ok = pos + m >= text.size() || !is_word_char(static_cast<unsigned char>(text[pos + m]));
    if (left_ok && right_ok) return true;
    pos = search(text, pos + 1);
  }
  return false;
}

bool BoyerMooreSearch::equals(std::string_view text) const {
  if (text.size() != pattern_.size()) return false;
  for (size_t i = 0; i < text.size(); ++i)
    if (fold(text[i]) != fold(pattern_[i])) return false;
  return true;
}

} // namespace vigil::util
