#pragma once
#include <sigil/schema/primitives.hpp>

// Schema type: unbind.
namespace sigil::schema {

template <uint16_t Version>
struct unbind;

template <>
struct unbind<1> final {
  uint16_t version{1};
  address_t contract{};
  token_id_t token_id{};
  achievement_id_t achievement_id{};
};

using unbind_t = unbind<1>;

}  // namespace sigil::schema
