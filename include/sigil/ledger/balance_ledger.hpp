#pragma once
#include <sigil/ledger/state.hpp>
#include <sigil/schema/primitives.hpp>

namespace sigil::ledger {

/// Multi-token balances: (account, achievement id) -> amount.
class balance_ledger final {
 public:
  explicit balance_ledger(state_t& state);

  sigil::schema::amount_t balance_of(
      const sigil::schema::address_t& account,
      const sigil::schema::achievement_id_t& achievement_id) const;

  /// False when `to` is null or the credit would overflow.
  bool mint(const sigil::schema::address_t& to,
            const sigil::schema::achievement_id_t& achievement_id,
            const sigil::schema::amount_t& amount);

  /// False when `from` holds less than `amount` or `to` is null.
  bool transfer(const sigil::schema::address_t& from,
                const sigil::schema::address_t& to,
                const sigil::schema::achievement_id_t& achievement_id,
                const sigil::schema::amount_t& amount);

 private:
  void store(const sigil::schema::address_t& account,
             const sigil::schema::achievement_id_t& achievement_id,
             const sigil::schema::amount_t& amount);

  state_t& state_;
};

}  // namespace sigil::ledger
