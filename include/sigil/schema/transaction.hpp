#pragma once
#include <sigil/schema/bind.hpp>
#include <sigil/schema/mint.hpp>
#include <sigil/schema/mint_batch.hpp>
#include <sigil/schema/primitives.hpp>
#include <sigil/schema/purchase.hpp>
#include <sigil/schema/purchase_and_bind.hpp>
#include <sigil/schema/set_owner_of_function.hpp>
#include <sigil/schema/set_payee.hpp>
#include <sigil/schema/unbind.hpp>
#include <string_view>
#include <variant>

namespace sigil::schema {

/// Seed hashed with BLAKE3 into the chain id used when none is configured.
inline constexpr auto kDefaultChainIdSeed = std::string_view{"sigil-chain"};

using transaction_payload_t = std::variant<mint_t,
                                           mint_batch_t,
                                           bind_t,
                                           unbind_t,
                                           purchase_t,
                                           purchase_and_bind_t,
                                           set_payee_t,
                                           set_owner_of_function_t>;

template <uint16_t Version>
struct transaction;

/// Envelope delivered by the hosting environment. `caller` is the
/// authenticated operator and `value` the settlement amount sent along.
template <>
struct transaction<1> final {
  uint16_t version{1};
  hash32_t chain_id{};
  address_t caller{};
  amount_t value{};
  transaction_payload_t payload{};
};

using transaction_t = transaction<1>;

}  // namespace sigil::schema
