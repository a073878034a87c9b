#pragma once
#include <sigil/oracle/contract_host.hpp>
#include <sigil/oracle/ownership_source.hpp>
#include <sigil/schema/primitives.hpp>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace sigil::oracle {

/// Override lookup: the owner-query signature recorded for a contract, if any.
using owner_of_function_lookup_t =
    std::function<std::optional<std::string>(const sigil::schema::address_t&)>;

/// Resolves and evaluates ownership of tokens held in external contracts.
///
/// The oracle trusts whatever the external contract reports. A failed query
/// is reported as its own outcome, never as "owner" or "not owner".
class ownership_oracle final {
 public:
  ownership_oracle(const contract_host& host,
                   owner_of_function_lookup_t lookup);

  /// The override recorded for `contract`, else the default signature.
  std::string resolve_function(const sigil::schema::address_t& contract) const;

  std::unique_ptr<ownership_source> resolve_source(
      const sigil::schema::address_t& contract) const;

  /// Whether `claimed_owner` currently owns (contract, token_id).
  ///
  /// Returns std::nullopt and sets `error` when ownership cannot be resolved:
  /// null contract address, missing contract, reverted call or undecodable
  /// return payload.
  std::optional<bool> owns_token(const sigil::schema::address_t& contract,
                                 const sigil::schema::token_id_t& token_id,
                                 const sigil::schema::address_t& claimed_owner,
                                 std::string& error) const;

 private:
  const contract_host& host_;
  owner_of_function_lookup_t lookup_;
};

}  // namespace sigil::oracle
