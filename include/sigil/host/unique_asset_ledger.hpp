#pragma once
#include <sigil/host/registry.hpp>
#include <sigil/oracle/contract_host.hpp>
#include <sigil/schema/primitives.hpp>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sigil::host {

/// Minimal non-fungible ledger: each token id has exactly one owner.
///
/// Answers owner queries for every signature it was constructed with, so a
/// collection exposing a non-standard owner function can be modelled.
class unique_asset_ledger final : public contract {
 public:
  unique_asset_ledger();
  explicit unique_asset_ledger(std::vector<std::string> owner_of_signatures);

  /// False when `to` is null or the token already exists.
  bool mint(const sigil::schema::address_t& to,
            const sigil::schema::token_id_t& token_id);

  /// False unless `from` currently owns the token and `to` is not null.
  bool transfer(const sigil::schema::address_t& from,
                const sigil::schema::address_t& to,
                const sigil::schema::token_id_t& token_id);

  std::optional<sigil::schema::address_t> owner_of(
      const sigil::schema::token_id_t& token_id) const;

  sigil::oracle::call_result static_call(
      const sigil::oracle::function_selector_t& selector,
      const sigil::schema::bytes_view_t& arguments) const override;

 private:
  std::set<sigil::oracle::function_selector_t> owner_of_selectors_;
  std::map<sigil::schema::token_id_t, sigil::schema::address_t> owners_;
};

}  // namespace sigil::host
