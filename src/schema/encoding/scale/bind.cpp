#include <sigil/schema/encoding/scale/bind.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const bind<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.contract, encoder);
  encode(o.token_id, encoder);
  encode(o.achievement_id, encoder);
  encode(o.uri, encoder);
}

void decode(bind<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.contract, decoder);
  decode(o.token_id, decoder);
  decode(o.achievement_id, decoder);
  decode(o.uri, decoder);
}

}  // namespace sigil::schema::encoding::scale
