#include <sigil/schema/encoding/scale/transaction_event_attribute.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const transaction_event_attribute<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.key, encoder);
  encode(o.value, encoder);
  encode(o.index, encoder);
}

void decode(transaction_event_attribute<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.key, decoder);
  decode(o.value, decoder);
  decode(o.index, decoder);
}

}  // namespace sigil::schema::encoding::scale
