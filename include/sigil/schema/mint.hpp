#pragma once
#include <sigil/schema/primitives.hpp>
#include <string>

// Schema type: mint.
// Administrator creates a new achievement and credits its initial supply.
namespace sigil::schema {

template <uint16_t Version>
struct mint;

template <>
struct mint<1> final {
  uint16_t version{1};
  address_t to{};
  amount_t amount{};
  std::string uri;  // empty records no default URI
  amount_t price{};
  bool permanent{};
};

using mint_t = mint<1>;

}  // namespace sigil::schema
