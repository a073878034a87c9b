#pragma once
#include <sigil/schema/transaction_event.hpp>
#include <scale/decoder.hpp>
#include <scale/encoder.hpp>

namespace sigil::schema::encoding::scale {

void encode(const sigil::schema::transaction_event<1>& o, ::scale::Encoder& encoder);
void decode(sigil::schema::transaction_event<1>& o, ::scale::Decoder& decoder);

}  // namespace sigil::schema::encoding::scale
