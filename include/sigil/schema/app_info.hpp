#pragma once
#include <sigil/schema/primitives.hpp>
#include <cstdint>

// Schema type: app info.
// Latest committed height (one per committed operation) and state root.
namespace sigil::schema {

template <uint16_t Version>
struct app_info;

template <>
struct app_info<1> final {
  uint16_t version{1};
  int64_t last_height{};
  hash32_t last_state_root{};
};

using app_info_t = app_info<1>;

}  // namespace sigil::schema
