#pragma once
#include <sigil/schema/binding_state.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sigil::schema::encoding::scale {

void encode(const sigil::schema::binding_state<1>& o, ::scale::Encoder& encoder);
void decode(sigil::schema::binding_state<1>& o, ::scale::Decoder& decoder);

}  // namespace sigil::schema::encoding::scale
