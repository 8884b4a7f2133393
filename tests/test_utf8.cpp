#include "minitest.hpp"
#include "utils.h"
#include <string>

TEST(utf8_decodes_degree_sign_as_one_codepoint) {
  std::string s = "\xC2\xB0" "C";
  size_t i = 0;
  ASSERT_EQ(utf8_next_codepoint(s, i), 0x00B0);
  ASSERT_EQ(i, 2u);
  ASSERT_EQ(utf8_next_codepoint(s, i), 'C');
  ASSERT_EQ(i, 3u);
}

TEST(utf8_ascii_advances_by_one) {
  std::string s = "A";
  size_t i = 0;
  ASSERT_EQ(utf8_next_codepoint(s, i), 'A');
  ASSERT_EQ(i, 1u);
}

TEST(utf8_truncated_sequence_ends_string) {
  std::string s = "\xC2";
  size_t i = 0;
  ASSERT_EQ(utf8_next_codepoint(s, i), 0xFFFD);
  ASSERT_EQ(i, s.size());

  std::string t = "ab\xE2\x82";
  size_t j = 2;
  ASSERT_EQ(utf8_next_codepoint(t, j), 0xFFFD);
  ASSERT_EQ(j, t.size());
}

TEST(utf8_bad_continuation_resyncs_on_next_byte) {
  std::string s = "\xC2" "A";
  size_t i = 0;
  ASSERT_EQ(utf8_next_codepoint(s, i), 0xFFFD);
  ASSERT_EQ(i, 1u);
  ASSERT_EQ(utf8_next_codepoint(s, i), 'A');
  ASSERT_EQ(i, 2u);
}

TEST(utf8_stray_byte_advances_by_one) {
  std::string s = "\xFF" "x";
  size_t i = 0;
  ASSERT_EQ(utf8_next_codepoint(s, i), 0xFFFD);
  ASSERT_EQ(i, 1u);

  std::string c = "\x80";
  size_t j = 0;
  ASSERT_EQ(utf8_next_codepoint(c, j), 0xFFFD);
  ASSERT_EQ(j, 1u);
}

TEST(utf8_four_byte_sequence) {
  std::string s = "\xF0\x9F\x94\xA5";
  size_t i = 0;
  ASSERT_EQ(utf8_next_codepoint(s, i), 0x1F525);
  ASSERT_EQ(i, 4u);
}
