#include <sigil/schema/encoding/scale/bind.hpp>
#include <sigil/schema/encoding/scale/mint.hpp>
#include <sigil/schema/encoding/scale/mint_batch.hpp>
#include <sigil/schema/encoding/scale/purchase.hpp>
#include <sigil/schema/encoding/scale/purchase_and_bind.hpp>
#include <sigil/schema/encoding/scale/set_owner_of_function.hpp>
#include <sigil/schema/encoding/scale/set_payee.hpp>
#include <sigil/schema/encoding/scale/transaction.hpp>
#include <sigil/schema/encoding/scale/unbind.hpp>

using namespace sigil::schema;

namespace sigil::schema::encoding::scale {

void encode(const transaction<1>& o, ::scale::Encoder& encoder) {
  encode(o.version, encoder);
  encode(o.chain_id, encoder);
  encode(o.caller, encoder);
  encode(o.value, encoder);
  encode(o.payload, encoder);
}

void decode(transaction<1>& o, ::scale::Decoder& decoder) {
  decode(o.version, decoder);
  decode(o.chain_id, decoder);
  decode(o.caller, decoder);
  decode(o.value, decoder);
  decode(o.payload, decoder);
}

}  // namespace sigil::schema::encoding::scale
