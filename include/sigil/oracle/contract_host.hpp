#pragma once
#include <sigil/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <string_view>

namespace sigil::oracle {

using function_selector_t = std::array<uint8_t, 4>;

enum class call_status : uint8_t { success = 0, reverted = 1, no_contract = 2 };

struct call_result final {
  call_status status{call_status::success};
  sigil::schema::bytes_t output;
};

/// Read-only cross-contract call surface used for ownership queries.
///
/// `static_call` is const: implementations must not mutate state, carry no
/// value, and must not hold a path back into the ledger.
class contract_host {
 public:
  virtual ~contract_host() = default;

  virtual call_result static_call(
      const sigil::schema::address_t& contract,
      const function_selector_t& selector,
      const sigil::schema::bytes_view_t& arguments) const = 0;
};

/// First four bytes of the BLAKE3 digest of a function signature string.
function_selector_t make_selector(std::string_view signature);

/// Single 256-bit argument, 32 bytes big-endian.
sigil::schema::bytes_t encode_token_id_argument(
    const sigil::schema::token_id_t& token_id);
std::optional<sigil::schema::token_id_t> decode_token_id_argument(
    const sigil::schema::bytes_view_t& arguments);

/// Address-shaped return value: 12 zero bytes followed by the address.
sigil::schema::bytes_t encode_address_result(
    const sigil::schema::address_t& address);
std::optional<sigil::schema::address_t> decode_address_result(
    const sigil::schema::bytes_view_t& output);

}  // namespace sigil::oracle
