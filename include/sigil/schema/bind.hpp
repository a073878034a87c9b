#pragma once
#include <sigil/schema/primitives.hpp>
#include <string>

// Schema type: bind.
// Attach one achievement unit to an external token owned by the caller.
namespace sigil::schema {

template <uint16_t Version>
struct bind;

template <>
struct bind<1> final {
  uint16_t version{1};
  address_t contract{};
  token_id_t token_id{};
  achievement_id_t achievement_id{};
  std::string uri;
};

using bind_t = bind<1>;

}  // namespace sigil::schema
