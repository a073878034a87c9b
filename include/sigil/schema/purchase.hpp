#pragma once
#include <sigil/schema/primitives.hpp>

// Schema type: purchase.
// Buy one unit from the administrator's supply; the transaction value must
// equal the achievement price exactly.
namespace sigil::schema {

template <uint16_t Version>
struct purchase;

template <>
struct purchase<1> final {
  uint16_t version{1};
  achievement_id_t achievement_id{};
};

using purchase_t = purchase<1>;

}  // namespace sigil::schema
