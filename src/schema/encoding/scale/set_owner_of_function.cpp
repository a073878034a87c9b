#include <sigil/schema/encoding/scale/set_owner_of_function.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const set_owner_of_function<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.contract, encoder);
  encode(o.signature, encoder);
}

void decode(set_owner_of_function<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.contract, decoder);
  decode(o.signature, decoder);
}

}  // namespace sigil::schema::encoding::scale
