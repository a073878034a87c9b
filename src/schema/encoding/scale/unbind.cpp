#include <sigil/schema/encoding/scale/unbind.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const unbind<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.contract, encoder);
  encode(o.token_id, encoder);
  encode(o.achievement_id, encoder);
}

void decode(unbind<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.contract, decoder);
  decode(o.token_id, decoder);
  decode(o.achievement_id, decoder);
}

}  // namespace sigil::schema::encoding::scale
