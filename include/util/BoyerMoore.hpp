#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace vigil::util {

// Boyer-Moore-Horspool literal search with a fixed 256-entry shift table.
// Average case O(n/m), worst case O(n*m). Case folding is ASCII only.
class BoyerMooreSearch {
public:
  static constexpr size_t npos = static_cast<size_t>(-1);

  BoyerMooreSearch() : BoyerMooreSearch(std::string_view{}, true) {}
  BoyerMooreSearch(std::string_view pattern, bool ignore_case);

  // Position of the first match at or after `from`, or npos.
  [[nodiscard]] size_t search(std::string_view text, size_t from = 0) const;

  [[nodiscard]] bool contains(std::string_view text) const { return search(text) != npos; }
  // Match must not touch a word character ([A-Za-z0-9_]) on either side.
  [[nodiscard]] bool contains_word(std::string_view text) const;
  [[nodiscard]] bool equals(std::string_view text) const;

  [[nodiscard]] const std::string& pattern() const { return pattern_; }
  [[nodiscard]] bool ignore_case() const { return ignore_case_; }

private:
  size_t shift_[256];
  std::string pattern_;
  bool ignore_case_{true};

  [[nodiscard]] unsigned char fold(char c) const;
  void compute_shift();
};

} // namespace vigil::util
