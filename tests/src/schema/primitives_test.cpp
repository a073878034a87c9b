#include <gtest/gtest.h>
#include <sigil/schema/primitives.hpp>

using namespace sigil::schema;

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = bytes_t(32, 0xAB);
  auto hash = make_hash32(input);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, try_make_hash32_requires_32_bytes) {
  auto hash = try_make_hash32(
      "0x0102030405060708090a0b0c0d0e0f101112131415161718191a1b1c1d1e1f20");
  ASSERT_TRUE(hash.has_value());
  EXPECT_EQ((*hash)[0], 0x01);
  EXPECT_EQ((*hash)[31], 0x20);
  EXPECT_FALSE(try_make_hash32("0x0102"));
}

TEST(primitives, address_hex_round_trips) {
  auto text = std::string{"0x00112233445566778899aabbccddeeff00112233"};
  auto address = try_make_address(text);
  ASSERT_TRUE(address.has_value());
  EXPECT_EQ(to_hex(*address), text);
  EXPECT_FALSE(is_zero(*address));
  EXPECT_TRUE(is_zero(make_zero_address()));
}

TEST(primitives, try_make_address_rejects_bad_input) {
  EXPECT_FALSE(try_make_address("0x1234"));
  EXPECT_FALSE(try_make_address("zz112233445566778899aabbccddeeff00112233"));
  EXPECT_FALSE(try_make_address("0x0"));
}

TEST(primitives, try_make_word_parses_decimal_and_hex) {
  EXPECT_EQ(try_make_word("42"), word_t{42});
  EXPECT_EQ(try_make_word("0x2a"), word_t{42});
  EXPECT_EQ(try_make_word("0xFF"), word_t{255});
  EXPECT_FALSE(try_make_word(""));
  EXPECT_FALSE(try_make_word("0x"));
  EXPECT_FALSE(try_make_word("12a"));
}

TEST(primitives, try_make_word_rejects_values_above_256_bits) {
  auto max_hex = std::string{"0x"} + std::string(64, 'f');
  EXPECT_EQ(try_make_word(max_hex), ~word_t{0});
  EXPECT_FALSE(try_make_word(std::string{"0x1"} + std::string(64, '0')));
  EXPECT_EQ(try_make_word("115792089237316195423570985008687907853269984665640"
                          "564039457584007913129639935"),
            ~word_t{0});
  EXPECT_FALSE(try_make_word("115792089237316195423570985008687907853269984665"
                             "640564039457584007913129639936"));
}

TEST(primitives, max_achievement_id_is_96_bits) {
  EXPECT_EQ(max_achievement_id(), (achievement_id_t{1} << 96) - 1);
}

TEST(primitives, hex_helpers_round_trip_bytes) {
  auto bytes = bytes_t{0x00, 0x7F, 0x80, 0xFF};
  auto hex = to_hex(bytes_view_t{bytes.data(), bytes.size()});
  EXPECT_EQ(hex, "007f80ff");
  EXPECT_EQ(from_hex(hex), bytes);
  EXPECT_FALSE(try_from_hex("abc"));
}
