#pragma once
#include <sigil/schema/primitives.hpp>
#include <cstdint>
#include <span>
#include <string_view>

namespace sigil::blake3 {

sigil::schema::hash32_t hash(const std::string_view& str);
sigil::schema::hash32_t hash(const sigil::schema::bytes_view_t& bytes);

}  // namespace sigil::blake3
