#include <sigil/codec/word.hpp>
#include <sigil/schema/achievement_state.hpp>

namespace sigil::schema {

amount_t max_price() {
  return (amount_t{1} << 255) - 1;
}

std::optional<word_t> try_pack(const achievement_state_t& state) {
  auto word = sigil::codec::try_insert_uint255(word_t{0}, state.price,
                                               kPriceBitOffset);
  if (!word.has_value()) {
    return std::nullopt;
  }
  return sigil::codec::try_insert_bool(*word, state.permanent,
                                       kPermanentBitOffset);
}

achievement_state_t unpack(const word_t& word) {
  return achievement_state_t{
      .price = sigil::codec::extract_uint255(word, kPriceBitOffset),
      .permanent = sigil::codec::extract_bool(word, kPermanentBitOffset)};
}

}  // namespace sigil::schema
