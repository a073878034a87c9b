#pragma once
#include <sigil/schema/purchase_and_bind.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sigil::schema::encoding::scale {

void encode(const sigil::schema::purchase_and_bind<1>& o, ::scale::Encoder& encoder);
void decode(sigil::schema::purchase_and_bind<1>& o, ::scale::Decoder& decoder);

}  // namespace sigil::schema::encoding::scale
