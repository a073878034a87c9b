#pragma once

#include <sigil/execution/admin_capability.hpp>
#include <sigil/ledger/state.hpp>
#include <sigil/oracle/contract_host.hpp>
#include <sigil/oracle/ownership_oracle.hpp>
#include <sigil/schema/app_info.hpp>
#include <sigil/schema/bind.hpp>
#include <sigil/schema/mint.hpp>
#include <sigil/schema/mint_batch.hpp>
#include <sigil/schema/primitives.hpp>
#include <sigil/schema/purchase.hpp>
#include <sigil/schema/purchase_and_bind.hpp>
#include <sigil/schema/set_owner_of_function.hpp>
#include <sigil/schema/set_payee.hpp>
#include <sigil/schema/transaction.hpp>
#include <sigil/schema/transaction_error_code.hpp>
#include <sigil/schema/transaction_event.hpp>
#include <sigil/schema/transaction_result.hpp>
#include <sigil/schema/unbind.hpp>
#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace sigil::execution {

struct engine_options final {
  /// Account allowed to mint and configure the ledger; also the seller for
  /// purchases.
  sigil::schema::address_t administrator{};
  /// The ledger's own account, holding units that are bound.
  sigil::schema::address_t ledger_address{};
  sigil::schema::hash32_t chain_id{};
};

/// Achievement ledger: mints priced achievements and binds units of them to
/// tokens held in external contracts.
///
/// Every public operation holds the instance mutex for its whole duration
/// and either commits all of its writes in one storage batch or none of
/// them. Each committed operation advances the height by one and folds its
/// events into the state root.
class engine final {
 public:
  engine(sigil::ledger::encoder_t& encoder,
         sigil::ledger::storage_t& storage,
         const sigil::oracle::contract_host& host,
         engine_options options);

  /// Capability for administrative operations, if `caller` is the
  /// administrator.
  std::optional<admin_capability> authorize_admin(
      const sigil::schema::address_t& caller) const;

  /// Decode a SCALE transaction, validate its envelope and dispatch it.
  sigil::schema::transaction_result_t execute(
      const sigil::schema::bytes_view_t& raw_tx);

  /// Create a new achievement. The new id is SCALE encoded in `data`.
  sigil::schema::transaction_result_t mint(const admin_capability& admin,
                                           const sigil::schema::mint_t& request);

  /// Create several achievements atomically. The new ids are SCALE encoded in
  /// `data` as a vector.
  sigil::schema::transaction_result_t mint_batch(
      const admin_capability& admin,
      const sigil::schema::mint_batch_t& request);

  sigil::schema::transaction_result_t bind(
      const sigil::schema::address_t& caller,
      const sigil::schema::bind_t& request);

  sigil::schema::transaction_result_t unbind(
      const sigil::schema::address_t& caller,
      const sigil::schema::unbind_t& request);

  /// Buy one unit from the administrator; `value` must equal the price.
  sigil::schema::transaction_result_t purchase(
      const sigil::schema::address_t& caller,
      const sigil::schema::amount_t& value,
      const sigil::schema::purchase_t& request);

  /// Purchase, then bind the purchased unit.
  ///
  /// The purchase commits before the bind is attempted. A failing bind
  /// leaves the purchase in place: the result carries the bind failure, the
  /// purchase event, and notes the committed purchase in `info`.
  sigil::schema::transaction_result_t purchase_and_bind(
      const sigil::schema::address_t& caller,
      const sigil::schema::amount_t& value,
      const sigil::schema::purchase_and_bind_t& request);

  sigil::schema::transaction_result_t set_payee(
      const admin_capability& admin,
      const sigil::schema::set_payee_t& request);

  sigil::schema::transaction_result_t set_owner_of_function(
      const admin_capability& admin,
      const sigil::schema::set_owner_of_function_t& request);

  std::optional<sigil::schema::amount_t> price_of(
      const sigil::schema::achievement_id_t& achievement_id) const;
  std::optional<bool> is_permanent(
      const sigil::schema::achievement_id_t& achievement_id) const;
  bool is_bound(const sigil::schema::address_t& contract,
                const sigil::schema::token_id_t& token_id,
                const sigil::schema::achievement_id_t& achievement_id) const;
  std::optional<std::string> achievement_uri(
      const sigil::schema::achievement_id_t& achievement_id) const;
  std::optional<std::string> binding_uri(
      const sigil::schema::address_t& contract,
      const sigil::schema::token_id_t& token_id,
      const sigil::schema::achievement_id_t& achievement_id) const;
  sigil::schema::amount_t balance_of(
      const sigil::schema::address_t& account,
      const sigil::schema::achievement_id_t& achievement_id) const;
  sigil::schema::amount_t deposits_of(
      const sigil::schema::address_t& payee) const;
  std::optional<sigil::schema::address_t> payee() const;
  std::string owner_of_function(const sigil::schema::address_t& contract) const;
  sigil::schema::achievement_id_t last_achievement_id() const;

  /// Latest committed height and state root.
  sigil::schema::app_info_t info() const;

  /// Persisted events with sequence numbers in [from_sequence, to_sequence].
  /// Sequence numbers start at 1.
  std::vector<sigil::schema::transaction_event_t> events(
      uint64_t from_sequence,
      uint64_t to_sequence) const;

  const engine_options& options() const { return options_; }

 private:
  using state_t = sigil::ledger::state_t;

  sigil::schema::transaction_result_t apply_mint(
      state_t& state,
      const admin_capability& admin,
      const sigil::schema::mint_t& request);
  sigil::schema::transaction_result_t apply_mint_batch(
      state_t& state,
      const admin_capability& admin,
      const sigil::schema::mint_batch_t& request);
  sigil::schema::transaction_result_t apply_bind(
      state_t& state,
      const sigil::schema::address_t& caller,
      const sigil::schema::bind_t& request);
  sigil::schema::transaction_result_t apply_unbind(
      state_t& state,
      const sigil::schema::address_t& caller,
      const sigil::schema::unbind_t& request);
  sigil::schema::transaction_result_t apply_purchase(
      state_t& state,
      const sigil::schema::address_t& caller,
      const sigil::schema::amount_t& value,
      const sigil::schema::purchase_t& request);

  /// Validate and mint one achievement into `state`; the error code on
  /// failure.
  std::optional<sigil::schema::transaction_error_code> mint_one(
      state_t& state,
      const sigil::schema::address_t& to,
      const sigil::schema::amount_t& amount,
      const std::string& uri,
      const sigil::schema::amount_t& price,
      bool permanent,
      sigil::schema::achievement_id_t& minted_id);

  /// Authorize `caller` against the external token's current owner.
  std::optional<sigil::schema::transaction_result_t> check_token_owner(
      const state_t& state,
      const sigil::schema::address_t& contract,
      const sigil::schema::token_id_t& token_id,
      const sigil::schema::address_t& caller) const;

  sigil::oracle::ownership_oracle make_oracle(const state_t& state) const;

  /// Persist events, fold the state root and commit the overlay atomically.
  void commit(state_t& state,
              const std::vector<sigil::schema::transaction_event_t>& events);

  void load_persisted_state();

  mutable std::mutex mutex_;
  sigil::ledger::encoder_t& encoder_;
  sigil::ledger::storage_t& storage_;
  const sigil::oracle::contract_host& host_;
  engine_options options_;
  int64_t last_committed_height_{};
  sigil::schema::hash32_t last_committed_state_root_{};
};

}  // namespace sigil::execution
