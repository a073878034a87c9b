#include <sigil/schema/encoding/scale/purchase.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const purchase<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.achievement_id, encoder);
}

void decode(purchase<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.achievement_id, decoder);
}

}  // namespace sigil::schema::encoding::scale
