#include <sigil/schema/encoding/scale/set_payee.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const set_payee<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.payee, encoder);
}

void decode(set_payee<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.payee, decoder);
}

}  // namespace sigil::schema::encoding::scale
