#pragma once
#include <sigil/schema/primitives.hpp>
#include <string>
#include <vector>

// Schema type: mint batch.
// Administrator creates several achievements at once; all four sequences
// are parallel and must have equal length.
namespace sigil::schema {

template <uint16_t Version>
struct mint_batch;

template <>
struct mint_batch<1> final {
  uint16_t version{1};
  address_t to{};
  std::vector<amount_t> amounts;
  std::vector<std::string> uris;
  std::vector<amount_t> prices;
  std::vector<bool> permanents;
};

using mint_batch_t = mint_batch<1>;

}  // namespace sigil::schema
