#pragma once

#include <cstdint>
#include <string_view>

namespace sigil::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  invalid_chain_id = 3,
  operation_not_payable = 4,
  null_address = 10,
  invalid_amount = 11,
  batch_length_mismatch = 12,
  empty_batch = 13,
  price_out_of_range = 14,
  achievement_id_exhausted = 15,
  invalid_achievement_id = 16,
  payee_not_configured = 17,
  custody_caller = 18,
  authorization_denied = 20,
  insufficient_achievement_balance = 21,
  not_token_owner = 22,
  already_bound = 30,
  not_bound = 31,
  permanently_bound = 32,
  achievement_sold_out = 33,
  ownership_resolution_failed = 40,
  payment_mismatch = 50,
};

/// Coarse failure classes callers act on.
enum class error_kind : uint8_t {
  none = 0,
  precondition_violation = 1,
  authorization_failure = 2,
  state_conflict = 3,
  external_resolution_failure = 4,
  payment_mismatch = 5,
};

constexpr error_kind error_kind_of(const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::authorization_denied:
    case transaction_error_code::insufficient_achievement_balance:
    case transaction_error_code::not_token_owner:
      return error_kind::authorization_failure;
    case transaction_error_code::already_bound:
    case transaction_error_code::not_bound:
    case transaction_error_code::permanently_bound:
    case transaction_error_code::achievement_sold_out:
      return error_kind::state_conflict;
    case transaction_error_code::ownership_resolution_failed:
      return error_kind::external_resolution_failure;
    case transaction_error_code::payment_mismatch:
      return error_kind::payment_mismatch;
    default:
      return error_kind::precondition_violation;
  }
}

/// Kind of a raw result code; 0 is success.
constexpr error_kind error_kind_of(const uint32_t code) {
  if (code == 0) {
    return error_kind::none;
  }
  return error_kind_of(static_cast<transaction_error_code>(code));
}

constexpr std::string_view to_string(const error_kind kind) {
  switch (kind) {
    case error_kind::none:
      return "none";
    case error_kind::precondition_violation:
      return "precondition_violation";
    case error_kind::authorization_failure:
      return "authorization_failure";
    case error_kind::state_conflict:
      return "state_conflict";
    case error_kind::external_resolution_failure:
      return "external_resolution_failure";
    case error_kind::payment_mismatch:
      return "payment_mismatch";
  }
  return "unknown";
}

}  // namespace sigil::schema
