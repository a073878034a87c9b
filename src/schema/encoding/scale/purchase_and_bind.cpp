#include <sigil/schema/encoding/scale/purchase_and_bind.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const purchase_and_bind<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.achievement_id, encoder);
  encode(o.contract, encoder);
  encode(o.token_id, encoder);
  encode(o.uri, encoder);
}

void decode(purchase_and_bind<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.achievement_id, decoder);
  decode(o.contract, decoder);
  decode(o.token_id, decoder);
  decode(o.uri, decoder);
}

}  // namespace sigil::schema::encoding::scale
