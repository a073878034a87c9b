#include <sigil/codec/word.hpp>
#include <sigil/common/critical.hpp>

using sigil::schema::word_t;

namespace sigil::codec {

namespace {

bool valid_field(const std::size_t bit_width, const std::size_t bit_offset) {
  return bit_width > 0 && bit_width <= kWordBits &&
         bit_offset <= (kWordBits - bit_width);
}

word_t field_mask(const std::size_t bit_width) {
  if (bit_width == kWordBits) {
    return ~word_t{0};
  }
  return (word_t{1} << bit_width) - 1;
}

}  // namespace

std::optional<word_t> try_insert(const word_t& word,
                                 const word_t& value,
                                 const std::size_t bit_width,
                                 const std::size_t bit_offset) {
  if (!valid_field(bit_width, bit_offset)) {
    return std::nullopt;
  }
  auto mask = field_mask(bit_width);
  if (value > mask) {
    return std::nullopt;
  }
  auto cleared = word_t{word & ~(mask << bit_offset)};
  return word_t{cleared | (value << bit_offset)};
}

word_t insert(const word_t& word,
              const word_t& value,
              const std::size_t bit_width,
              const std::size_t bit_offset) {
  auto inserted = try_insert(word, value, bit_width, bit_offset);
  if (!inserted.has_value()) {
    sigil::common::critical("word field insert out of bounds or overflowing");
  }
  return *inserted;
}

std::optional<word_t> try_extract(const word_t& word,
                                  const std::size_t bit_width,
                                  const std::size_t bit_offset) {
  if (!valid_field(bit_width, bit_offset)) {
    return std::nullopt;
  }
  return word_t{(word >> bit_offset) & field_mask(bit_width)};
}

word_t extract(const word_t& word,
               const std::size_t bit_width,
               const std::size_t bit_offset) {
  auto extracted = try_extract(word, bit_width, bit_offset);
  if (!extracted.has_value()) {
    sigil::common::critical("word field extract out of bounds");
  }
  return *extracted;
}

std::optional<word_t> try_insert_bool(const word_t& word,
                                      const bool value,
                                      const std::size_t bit_offset) {
  return try_insert(word, value ? word_t{1} : word_t{0}, 1, bit_offset);
}

bool extract_bool(const word_t& word, const std::size_t bit_offset) {
  return extract(word, 1, bit_offset) != 0;
}

std::optional<word_t> try_insert_uint255(const word_t& word,
                                         const word_t& value,
                                         const std::size_t bit_offset) {
  return try_insert(word, value, 255, bit_offset);
}

word_t extract_uint255(const word_t& word, const std::size_t bit_offset) {
  return extract(word, 255, bit_offset);
}

}  // namespace sigil::codec
