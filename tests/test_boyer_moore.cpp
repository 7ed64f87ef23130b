#include "minitest.hpp"
#include "util/BoyerMoore.hpp"
#include <string>

using safere::util::BoyerMooreSearch;

TEST(bm_finds_first_occurrence) {
  BoyerMooreSearch bm("needle");
  ASSERT_EQ(bm.search("haystack with a needle and another needle"), 16u);
  ASSERT_EQ(bm.search("needle"), 0u);
  ASSERT_EQ(bm.search("needl"), BoyerMooreSearch::npos);
  ASSERT_EQ(bm.search(""), BoyerMooreSearch::npos);
}

TEST(bm_search_from_offset) {
  BoyerMooreSearch bm("ab");
  std::string text = "ab ab ab";
  ASSERT_EQ(bm.search(text, 0), 0u);
  ASSERT_EQ(bm.search(text, 1), 3u);
  ASSERT_EQ(bm.search(text, 6), 6u);
  ASSERT_EQ(bm.search(text, 7), BoyerMooreSearch::npos);
  ASSERT_EQ(bm.search(text, 100), BoyerMooreSearch::npos);
}

TEST(bm_empty_pattern_matches_at_offset) {
  BoyerMooreSearch bm("");
  ASSERT_TRUE(bm.empty());
  ASSERT_EQ(bm.search("abc", 2), 2u);
  ASSERT_EQ(bm.search("abc", 3), 3u);
}

TEST(bm_repeated_characters) {
  BoyerMooreSearch bm("aab");
  ASSERT_EQ(bm.search("aaaaaab"), 4u);
  BoyerMooreSearch tail("abab");
  ASSERT_EQ(tail.search("abaabababab"), 3u);
}

TEST(bm_ascii_folding) {
  BoyerMooreSearch bm("Hello", true);
  ASSERT_EQ(bm.search("say hELLO"), 4u);
  BoyerMooreSearch exact("Hello");
  ASSERT_EQ(exact.search("say hELLO"), BoyerMooreSearch::npos);
}

TEST(bm_multibyte_bytes) {
  BoyerMooreSearch bm("\xc3\xa9t\xc3\xa9");
  ASSERT_EQ(bm.search("l'\xc3\xa9t\xc3\xa9"), 2u);
  ASSERT_EQ(bm.pattern(), "\xc3\xa9t\xc3\xa9");
}
