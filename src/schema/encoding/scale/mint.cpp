#include <sigil/schema/encoding/scale/mint.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const mint<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.to, encoder);
  encode(o.amount, encoder);
  encode(o.uri, encoder);
  encode(o.price, encoder);
  encode(o.permanent, encoder);
}

void decode(mint<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.to, decoder);
  decode(o.amount, decoder);
  decode(o.uri, decoder);
  decode(o.price, decoder);
  decode(o.permanent, decoder);
}

}  // namespace sigil::schema::encoding::scale
