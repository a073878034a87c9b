#pragma once
#include <sigil/schema/set_owner_of_function.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sigil::schema::encoding::scale {

void encode(const sigil::schema::set_owner_of_function<1>& o, ::scale::Encoder& encoder);
void decode(sigil::schema::set_owner_of_function<1>& o, ::scale::Decoder& decoder);

}  // namespace sigil::schema::encoding::scale
