#pragma once
#include <sigil/schema/primitives.hpp>
#include <string>

// Schema type: set owner-of function.
// Override the owner query issued against one external contract. An empty
// signature removes the override.
namespace sigil::schema {

template <uint16_t Version>
struct set_owner_of_function;

template <>
struct set_owner_of_function<1> final {
  uint16_t version{1};
  address_t contract{};
  std::string signature;
};

using set_owner_of_function_t = set_owner_of_function<1>;

}  // namespace sigil::schema
