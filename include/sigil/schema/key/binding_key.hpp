#pragma once
#include <sigil/schema/primitives.hpp>
#include <optional>
#include <utility>

// Composite binding key: the external contract address in the high 160 bits
// and the achievement id in the low 96 bits of one word. Injective over
// (address, 96-bit id), so one lookup key addresses the two-dimensional
// (contract, achievement) namespace.
namespace sigil::schema::key {

using binding_key_t = sigil::schema::word_t;

/// std::nullopt when `achievement_id` does not fit in 96 bits.
std::optional<binding_key_t> try_encode_binding_key(
    const sigil::schema::address_t& contract,
    const sigil::schema::achievement_id_t& achievement_id);

binding_key_t encode_binding_key(
    const sigil::schema::address_t& contract,
    const sigil::schema::achievement_id_t& achievement_id);

std::pair<sigil::schema::address_t, sigil::schema::achievement_id_t>
decode_binding_key(const binding_key_t& key);

}  // namespace sigil::schema::key
