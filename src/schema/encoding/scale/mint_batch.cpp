#include <sigil/schema/encoding/scale/mint_batch.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const mint_batch<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.to, encoder);
  encode(o.amounts, encoder);
  encode(o.uris, encoder);
  encode(o.prices, encoder);
  encode(o.permanents, encoder);
}

void decode(mint_batch<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.to, decoder);
  decode(o.amounts, decoder);
  decode(o.uris, decoder);
  decode(o.prices, decoder);
  decode(o.permanents, decoder);
}

}  // namespace sigil::schema::encoding::scale
