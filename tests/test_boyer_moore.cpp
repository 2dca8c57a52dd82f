#include "minitest.hpp"
#include "util/BoyerMoore.hpp"

using vigil::util::BoyerMooreSearch;

TEST(bm_finds_first_match) {
  BoyerMooreSearch bm("needle", false);
  ASSERT_EQ(bm.search("haystack with a needle and another needle"), 16u);
  ASSERT_EQ(bm.search("haystack with a needle and another needle", 17), 35u);
  ASSERT_EQ(bm.search("no match here"), BoyerMooreSearch::npos);
  ASSERT_EQ(bm.search("need"), BoyerMooreSearch::npos);
}

TEST(bm_ignore_case_folds_both_sides) {
  BoyerMooreSearch bm("FireFox", true);
  ASSERT_TRUE(bm.contains("/usr/lib/firefox/firefox"));
  ASSERT_TRUE(bm.contains("FIREFOX-bin"));
  BoyerMooreSearch exact("FireFox", false);
  ASSERT_TRUE(!exact.contains("firefox"));
}

TEST(bm_whole_word_boundaries) {
  BoyerMooreSearch bm("sh", true);
  ASSERT_TRUE(bm.contains_word("sh -c ls"));
  ASSERT_TRUE(bm.contains_word("/bin/sh"));
  ASSERT_TRUE(!bm.contains_word("bash"));
  ASSERT_TRUE(!bm.contains_word("sh_wrapper"));
  ASSERT_TRUE(bm.contains_word("bash sh"));
}

TEST(bm_equals_and_empty_pattern) {
  BoyerMooreSearch bm("Vim", true);
  ASSERT_TRUE(bm.equals("vim"));
  ASSERT_TRUE(!bm.equals("vim2"));
  BoyerMooreSearch empty("", true);
  ASSERT_EQ(empty.search("abc"), 0u);
  ASSERT_TRUE(empty.contains(""));
}
