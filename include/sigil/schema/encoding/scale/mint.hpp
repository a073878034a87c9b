#pragma once
#include <sigil/schema/mint.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sigil::schema::encoding::scale {

void encode(const sigil::schema::mint<1>& o, ::scale::Encoder& encoder);
void decode(sigil::schema::mint<1>& o, ::scale::Decoder& decoder);

}  // namespace sigil::schema::encoding::scale
