#pragma once
#include <sigil/schema/transaction.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sigil::schema::encoding::scale {

void encode(const sigil::schema::transaction<1>& o, ::scale::Encoder& encoder);
void decode(sigil::schema::transaction<1>& o, ::scale::Decoder& decoder);

}  // namespace sigil::schema::encoding::scale
