#pragma once
#include <sigil/schema/primitives.hpp>
#include <cstddef>
#include <optional>

// Schema type: achievement state.
// Per-achievement sale terms. Persisted as a single packed word: `permanent`
// is the most significant bit, `price` fills the 255 bits below it.
namespace sigil::schema {

template <uint16_t Version>
struct achievement_state;

template <>
struct achievement_state<1> final {
  uint16_t version{1};
  amount_t price{};
  bool permanent{};
};

using achievement_state_t = achievement_state<1>;

inline constexpr auto kPriceBitOffset = std::size_t{0};
inline constexpr auto kPermanentBitOffset = std::size_t{255};

/// Largest representable price (2^255 - 1).
amount_t max_price();

/// Pack into the storage word; nullopt when the price exceeds 255 bits.
std::optional<word_t> try_pack(const achievement_state_t& state);
achievement_state_t unpack(const word_t& word);

}  // namespace sigil::schema
