#include <sigil/ledger/escrow.hpp>
#include <sigil/schema/key/ledger_keys.hpp>

#include <limits>

namespace sigil::ledger {

escrow::escrow(state_t& state) : state_{state} {}

bool escrow::deposit(const sigil::schema::address_t& payee,
                     const sigil::schema::amount_t& amount) {
  if (sigil::schema::is_zero(payee)) {
    return false;
  }
  auto current = deposits_of(payee);
  if (amount > std::numeric_limits<sigil::schema::amount_t>::max() - current) {
    return false;
  }
  state_.put(sigil::schema::key::make_escrow_key(payee), current + amount);
  return true;
}

sigil::schema::amount_t escrow::deposits_of(
    const sigil::schema::address_t& payee) const {
  return state_.get<sigil::schema::amount_t>(
                   sigil::schema::key::make_escrow_key(payee))
      .value_or(sigil::schema::amount_t{0});
}

}  // namespace sigil::ledger
