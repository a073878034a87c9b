#pragma once
#include <sigil/schema/primitives.hpp>

// Schema type: set payee.
namespace sigil::schema {

template <uint16_t Version>
struct set_payee;

template <>
struct set_payee<1> final {
  uint16_t version{1};
  address_t payee{};
};

using set_payee_t = set_payee<1>;

}  // namespace sigil::schema
