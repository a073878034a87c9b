#pragma once
#include <sigil/schema/primitives.hpp>
#include <string>

// Schema type: purchase and bind.
// Purchase followed by bind. The two steps commit separately.
namespace sigil::schema {

template <uint16_t Version>
struct purchase_and_bind;

template <>
struct purchase_and_bind<1> final {
  uint16_t version{1};
  achievement_id_t achievement_id{};
  address_t contract{};
  token_id_t token_id{};
  std::string uri;
};

using purchase_and_bind_t = purchase_and_bind<1>;

}  // namespace sigil::schema
