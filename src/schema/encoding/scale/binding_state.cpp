#include <sigil/schema/encoding/scale/binding_state.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const binding_state<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.bound, encoder);
  encode(o.uri, encoder);
}

void decode(binding_state<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.bound, decoder);
  decode(o.uri, decoder);
}

}  // namespace sigil::schema::encoding::scale
