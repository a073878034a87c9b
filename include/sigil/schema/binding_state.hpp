#pragma once
#include <cstdint>
#include <string>

// Schema type: binding state.
// One achievement unit held in custody on behalf of an external token, with
// the metadata URI supplied when it was bound.
namespace sigil::schema {

template <uint16_t Version>
struct binding_state;

template <>
struct binding_state<1> final {
  uint16_t version{1};
  bool bound{};
  std::string uri;
};

using binding_state_t = binding_state<1>;

}  // namespace sigil::schema
