#include <sigil/ledger/balance_ledger.hpp>
#include <sigil/schema/key/ledger_keys.hpp>

#include <limits>

using namespace sigil::schema;

namespace sigil::ledger {

balance_ledger::balance_ledger(state_t& state) : state_{state} {}

amount_t balance_ledger::balance_of(
    const address_t& account,
    const achievement_id_t& achievement_id) const {
  return state_
      .get<amount_t>(sigil::schema::key::make_balance_key(account,
                                                          achievement_id))
      .value_or(amount_t{0});
}

bool balance_ledger::mint(const address_t& to,
                          const achievement_id_t& achievement_id,
                          const amount_t& amount) {
  if (is_zero(to)) {
    return false;
  }
  auto balance = balance_of(to, achievement_id);
  if (amount > std::numeric_limits<amount_t>::max() - balance) {
    return false;
  }
  store(to, achievement_id, balance + amount);
  return true;
}

bool balance_ledger::transfer(const address_t& from,
                              const address_t& to,
                              const achievement_id_t& achievement_id,
                              const amount_t& amount) {
  if (is_zero(to)) {
    return false;
  }
  auto from_balance = balance_of(from, achievement_id);
  if (from_balance < amount) {
    return false;
  }
  store(from, achievement_id, from_balance - amount);
  // Read after the debit so a self-transfer nets to zero.
  auto to_balance = balance_of(to, achievement_id);
  store(to, achievement_id, to_balance + amount);
  return true;
}

void balance_ledger::store(const address_t& account,
                           const achievement_id_t& achievement_id,
                           const amount_t& amount) {
  auto key = sigil::schema::key::make_balance_key(account, achievement_id);
  if (amount == 0) {
    state_.erase(key);
    return;
  }
  state_.put(key, amount);
}

}  // namespace sigil::ledger
