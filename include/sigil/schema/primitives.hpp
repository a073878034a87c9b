#pragma once
#include <array>
#include <boost/multiprecision/cpp_int.hpp>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace sigil::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;

// 256-bit machine word; also the width of prices, balances and token ids.
using word_t = boost::multiprecision::uint256_t;
using amount_t = boost::multiprecision::uint256_t;
using token_id_t = boost::multiprecision::uint256_t;

// Achievement ids are bounded to 96 bits by the ledger, carried in 128.
using achievement_id_t = boost::multiprecision::uint128_t;

inline constexpr auto kAchievementIdBits = std::size_t{96};
inline constexpr auto kAddressBits = std::size_t{160};

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string_view make_string_view(const bytes_t& bytes);
std::string make_string(const bytes_view_t& bytes);

hash32_t make_hash32(const bytes_t& bytes);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();
bool is_zero(const address_t& address);

/// Largest achievement id the ledger can assign (2^96 - 1).
achievement_id_t max_achievement_id();

/// Parse a decimal or 0x-prefixed hexadecimal unsigned 256-bit value.
std::optional<word_t> try_make_word(const std::string_view& text);

std::string to_hex(const bytes_view_t& bytes);
std::string to_hex(const address_t& address);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

}  // namespace sigil::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
