#pragma once
#include <sigil/schema/primitives.hpp>
#include <cstddef>
#include <optional>

// Fixed-width bit-field packing over a single 256-bit word.
//
// Every field occupies [bit_offset, bit_offset + bit_width) counted from the
// least significant bit. The try_ variants report invalid ranges and values
// that do not fit as std::nullopt; the plain variants treat them as fatal.
namespace sigil::codec {

inline constexpr auto kWordBits = std::size_t{256};

/// Write `value` into `word` at the given field, zeroing the field first and
/// preserving every other bit.
std::optional<sigil::schema::word_t> try_insert(
    const sigil::schema::word_t& word,
    const sigil::schema::word_t& value,
    std::size_t bit_width,
    std::size_t bit_offset);

sigil::schema::word_t insert(const sigil::schema::word_t& word,
                             const sigil::schema::word_t& value,
                             std::size_t bit_width,
                             std::size_t bit_offset);

/// Read the field back; the inverse of insert for the same width/offset.
std::optional<sigil::schema::word_t> try_extract(
    const sigil::schema::word_t& word,
    std::size_t bit_width,
    std::size_t bit_offset);

sigil::schema::word_t extract(const sigil::schema::word_t& word,
                              std::size_t bit_width,
                              std::size_t bit_offset);

std::optional<sigil::schema::word_t> try_insert_bool(
    const sigil::schema::word_t& word,
    bool value,
    std::size_t bit_offset);
bool extract_bool(const sigil::schema::word_t& word, std::size_t bit_offset);

std::optional<sigil::schema::word_t> try_insert_uint255(
    const sigil::schema::word_t& word,
    const sigil::schema::word_t& value,
    std::size_t bit_offset);
sigil::schema::word_t extract_uint255(const sigil::schema::word_t& word,
                                      std::size_t bit_offset);

}  // namespace sigil::codec
