#pragma once
#include <sigil/ledger/state.hpp>
#include <sigil/schema/primitives.hpp>

namespace sigil::ledger {

/// Withdraw-later payment queue keyed by payee. Deposits accumulate exactly
/// the forwarded amount; withdrawal happens outside the ledger.
class escrow final {
 public:
  explicit escrow(state_t& state);

  /// False when `payee` is null or the deposit would overflow.
  bool deposit(const sigil::schema::address_t& payee,
               const sigil::schema::amount_t& amount);

  sigil::schema::amount_t deposits_of(
      const sigil::schema::address_t& payee) const;

 private:
  state_t& state_;
};

}  // namespace sigil::ledger
