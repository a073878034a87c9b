#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <sigil/blake3/hash.hpp>
#include <sigil/common/critical.hpp>
#include <sigil/execution/engine.hpp>
#include <sigil/ledger/balance_ledger.hpp>
#include <sigil/ledger/escrow.hpp>
#include <sigil/schema/achievement_state.hpp>
#include <sigil/schema/binding_state.hpp>
#include <sigil/schema/key/binding_key.hpp>
#include <sigil/schema/key/ledger_keys.hpp>
#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>
#include <variant>

using namespace sigil::schema;

namespace {

using state_t = sigil::ledger::state_t;

constexpr auto kLedgerCodespace = std::string_view{"sigil.ledger"};
constexpr auto kExecuteCodespace = std::string_view{"sigil.execute"};

std::string_view describe(const transaction_error_code code) {
  switch (code) {
    case transaction_error_code::invalid_transaction:
      return "invalid transaction";
    case transaction_error_code::unsupported_transaction_version:
      return "unsupported transaction version";
    case transaction_error_code::invalid_chain_id:
      return "invalid chain id";
    case transaction_error_code::operation_not_payable:
      return "operation does not accept value";
    case transaction_error_code::null_address:
      return "null address";
    case transaction_error_code::invalid_amount:
      return "invalid amount";
    case transaction_error_code::batch_length_mismatch:
      return "batch lengths differ";
    case transaction_error_code::empty_batch:
      return "empty batch";
    case transaction_error_code::price_out_of_range:
      return "price out of range";
    case transaction_error_code::achievement_id_exhausted:
      return "achievement ids exhausted";
    case transaction_error_code::invalid_achievement_id:
      return "invalid achievement id";
    case transaction_error_code::payee_not_configured:
      return "payee not configured";
    case transaction_error_code::custody_caller:
      return "ledger custody address cannot act as caller";
    case transaction_error_code::authorization_denied:
      return "caller is not the administrator";
    case transaction_error_code::insufficient_achievement_balance:
      return "caller holds no unit of the achievement";
    case transaction_error_code::not_token_owner:
      return "caller does not own the external token";
    case transaction_error_code::already_bound:
      return "achievement already bound to token";
    case transaction_error_code::not_bound:
      return "achievement not bound to token";
    case transaction_error_code::permanently_bound:
      return "achievement is permanently bound";
    case transaction_error_code::achievement_sold_out:
      return "achievement sold out";
    case transaction_error_code::ownership_resolution_failed:
      return "ownership could not be resolved";
    case transaction_error_code::payment_mismatch:
      return "payment does not match price";
  }
  return "unknown error";
}

transaction_result_t make_failure(
    const transaction_error_code code,
    std::string info = {},
    const std::string_view codespace = kLedgerCodespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::string{describe(code)};
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  spdlog::debug("Rejected operation: {} ({})", result.log, result.info);
  return result;
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value,
                                             bool index = true) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = index};
}

bool valid_achievement_id(const achievement_id_t& achievement_id) {
  return achievement_id != 0 && achievement_id <= max_achievement_id();
}

std::optional<achievement_state_t> load_achievement(
    const state_t& state,
    const achievement_id_t& achievement_id) {
  if (!valid_achievement_id(achievement_id)) {
    return std::nullopt;
  }
  auto word = state.get<word_t>(key::make_achievement_key(achievement_id));
  if (!word.has_value()) {
    return std::nullopt;
  }
  return unpack(*word);
}

std::optional<bytes_t> binding_row_key(const address_t& contract,
                                       const token_id_t& token_id,
                                       const achievement_id_t& achievement_id) {
  if (!valid_achievement_id(achievement_id)) {
    return std::nullopt;
  }
  auto binding_key = key::try_encode_binding_key(contract, achievement_id);
  if (!binding_key.has_value()) {
    return std::nullopt;
  }
  return key::make_binding_key(*binding_key, token_id);
}

std::optional<transaction_t> decode_transaction(
    sigil::ledger::encoder_t& encoder,
    const bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  try {
    auto tx = encoder.try_decode<transaction_t>(raw_tx);
    if (!tx.has_value()) {
      error = "malformed SCALE transaction";
    }
    return tx;
  } catch (const std::exception& ex) {
    error = ex.what();
    return std::nullopt;
  }
}

}  // namespace

namespace sigil::execution {

engine::engine(sigil::ledger::encoder_t& encoder,
               sigil::ledger::storage_t& storage,
               const sigil::oracle::contract_host& host,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      host_{host},
      options_{std::move(options)} {
  auto lock = std::scoped_lock{mutex_};
  if (is_zero(options_.administrator)) {
    sigil::common::critical("administrator address must not be null");
  }
  if (is_zero(options_.ledger_address)) {
    sigil::common::critical("ledger address must not be null");
  }
  if (options_.administrator == options_.ledger_address) {
    sigil::common::critical("administrator and ledger address must differ");
  }
  load_persisted_state();
  spdlog::info("Achievement ledger {} ready at height {}",
               to_hex(options_.ledger_address), last_committed_height_);
}

std::optional<admin_capability> engine::authorize_admin(
    const address_t& caller) const {
  if (caller != options_.administrator) {
    return std::nullopt;
  }
  return admin_capability{caller};
}

transaction_result_t engine::execute(const bytes_view_t& raw_tx) {
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(encoder_, raw_tx, decode_error);
  if (!maybe_tx) {
    return make_failure(transaction_error_code::invalid_transaction,
                        decode_error, kExecuteCodespace);
  }
  const auto& tx = *maybe_tx;
  if (tx.version != 1) {
    return make_failure(transaction_error_code::unsupported_transaction_version,
                        "expected version 1", kExecuteCodespace);
  }
  if (tx.chain_id != options_.chain_id) {
    return make_failure(transaction_error_code::invalid_chain_id,
                        "transaction chain id does not match",
                        kExecuteCodespace);
  }
  if (is_zero(tx.caller)) {
    return make_failure(transaction_error_code::null_address,
                        "caller must not be null", kExecuteCodespace);
  }
  auto payable = std::holds_alternative<purchase_t>(tx.payload) ||
                 std::holds_alternative<purchase_and_bind_t>(tx.payload);
  if (!payable && tx.value != 0) {
    return make_failure(transaction_error_code::operation_not_payable,
                        fmt::format("value {} sent", tx.value.str()),
                        kExecuteCodespace);
  }

  auto denied = [&]() {
    return make_failure(transaction_error_code::authorization_denied,
                        to_hex(tx.caller), kExecuteCodespace);
  };
  return std::visit(
      overloaded{
          [&](const mint_t& payload) {
            auto admin = authorize_admin(tx.caller);
            return admin ? mint(*admin, payload) : denied();
          },
          [&](const mint_batch_t& payload) {
            auto admin = authorize_admin(tx.caller);
            return admin ? mint_batch(*admin, payload) : denied();
          },
          [&](const bind_t& payload) { return bind(tx.caller, payload); },
          [&](const unbind_t& payload) { return unbind(tx.caller, payload); },
          [&](const purchase_t& payload) {
            return purchase(tx.caller, tx.value, payload);
          },
          [&](const purchase_and_bind_t& payload) {
            return purchase_and_bind(tx.caller, tx.value, payload);
          },
          [&](const set_payee_t& payload) {
            auto admin = authorize_admin(tx.caller);
            return admin ? set_payee(*admin, payload) : denied();
          },
          [&](const set_owner_of_function_t& payload) {
            auto admin = authorize_admin(tx.caller);
            return admin ? set_owner_of_function(*admin, payload) : denied();
          }},
      tx.payload);
}

transaction_result_t engine::mint(const admin_capability& admin,
                                  const mint_t& request) {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  auto result = apply_mint(state, admin, request);
  if (result.ok()) {
    commit(state, result.events);
  }
  return result;
}

transaction_result_t engine::mint_batch(const admin_capability& admin,
                                        const mint_batch_t& request) {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  auto result = apply_mint_batch(state, admin, request);
  if (result.ok()) {
    commit(state, result.events);
  }
  return result;
}

transaction_result_t engine::bind(const address_t& caller,
                                  const bind_t& request) {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  auto result = apply_bind(state, caller, request);
  if (result.ok()) {
    commit(state, result.events);
  }
  return result;
}

transaction_result_t engine::unbind(const address_t& caller,
                                    const unbind_t& request) {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  auto result = apply_unbind(state, caller, request);
  if (result.ok()) {
    commit(state, result.events);
  }
  return result;
}

transaction_result_t engine::purchase(const address_t& caller,
                                      const amount_t& value,
                                      const purchase_t& request) {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  auto result = apply_purchase(state, caller, value, request);
  if (result.ok()) {
    commit(state, result.events);
  }
  return result;
}

transaction_result_t engine::purchase_and_bind(
    const address_t& caller,
    const amount_t& value,
    const purchase_and_bind_t& request) {
  auto lock = std::scoped_lock{mutex_};

  auto purchase_state = state_t{storage_, encoder_};
  auto purchased = apply_purchase(
      purchase_state, caller, value,
      purchase_t{.achievement_id = request.achievement_id});
  if (!purchased.ok()) {
    return purchased;
  }
  commit(purchase_state, purchased.events);

  auto bind_state = state_t{storage_, encoder_};
  auto bound = apply_bind(bind_state, caller,
                          bind_t{.contract = request.contract,
                                 .token_id = request.token_id,
                                 .achievement_id = request.achievement_id,
                                 .uri = request.uri});
  if (!bound.ok()) {
    spdlog::warn("Purchase of achievement {} by {} committed but bind failed",
                 request.achievement_id.str(), to_hex(caller));
    bound.info = fmt::format("purchase committed; bind failed: {}",
                             bound.info.empty() ? bound.log : bound.info);
    bound.events = std::move(purchased.events);
    return bound;
  }
  commit(bind_state, bound.events);
  bound.events.insert(std::begin(bound.events),
                      std::begin(purchased.events),
                      std::end(purchased.events));
  return bound;
}

transaction_result_t engine::set_payee(const admin_capability& admin,
                                       const set_payee_t& request) {
  auto lock = std::scoped_lock{mutex_};
  if (admin.administrator() != options_.administrator) {
    return make_failure(transaction_error_code::authorization_denied,
                        to_hex(admin.administrator()));
  }
  if (is_zero(request.payee)) {
    return make_failure(transaction_error_code::null_address,
                        "payee must not be null");
  }
  auto state = state_t{storage_, encoder_};
  state.put(key::make_singleton_key(key::kPayeeKey), request.payee);
  commit(state, {});
  spdlog::info("Payee set to {}", to_hex(request.payee));
  return transaction_result_t{};
}

transaction_result_t engine::set_owner_of_function(
    const admin_capability& admin,
    const set_owner_of_function_t& request) {
  auto lock = std::scoped_lock{mutex_};
  if (admin.administrator() != options_.administrator) {
    return make_failure(transaction_error_code::authorization_denied,
                        to_hex(admin.administrator()));
  }
  if (is_zero(request.contract)) {
    return make_failure(transaction_error_code::null_address,
                        "contract must not be null");
  }
  auto state = state_t{storage_, encoder_};
  auto key = key::make_owner_of_function_key(request.contract);
  if (request.signature.empty()) {
    state.erase(key);
    spdlog::info("Cleared owner query override for {}",
                 to_hex(request.contract));
  } else {
    state.put(key, request.signature);
    spdlog::info("Owner query for {} set to '{}'", to_hex(request.contract),
                 request.signature);
  }
  commit(state, {});
  return transaction_result_t{};
}

std::optional<amount_t> engine::price_of(
    const achievement_id_t& achievement_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  auto achievement = load_achievement(state, achievement_id);
  if (!achievement.has_value()) {
    return std::nullopt;
  }
  return achievement->price;
}

std::optional<bool> engine::is_permanent(
    const achievement_id_t& achievement_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  auto achievement = load_achievement(state, achievement_id);
  if (!achievement.has_value()) {
    return std::nullopt;
  }
  return achievement->permanent;
}

bool engine::is_bound(const address_t& contract,
                      const token_id_t& token_id,
                      const achievement_id_t& achievement_id) const {
  return binding_uri(contract, token_id, achievement_id).has_value();
}

std::optional<std::string> engine::achievement_uri(
    const achievement_id_t& achievement_id) const {
  auto lock = std::scoped_lock{mutex_};
  if (!valid_achievement_id(achievement_id)) {
    return std::nullopt;
  }
  auto state = state_t{storage_, encoder_};
  return state.get<std::string>(key::make_achievement_uri_key(achievement_id));
}

std::optional<std::string> engine::binding_uri(
    const address_t& contract,
    const token_id_t& token_id,
    const achievement_id_t& achievement_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto row = binding_row_key(contract, token_id, achievement_id);
  if (!row.has_value()) {
    return std::nullopt;
  }
  auto state = state_t{storage_, encoder_};
  auto binding = state.get<binding_state_t>(*row);
  if (!binding.has_value() || !binding->bound) {
    return std::nullopt;
  }
  return binding->uri;
}

amount_t engine::balance_of(const address_t& account,
                            const achievement_id_t& achievement_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  return sigil::ledger::balance_ledger{state}.balance_of(account,
                                                         achievement_id);
}

amount_t engine::deposits_of(const address_t& payee) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  return sigil::ledger::escrow{state}.deposits_of(payee);
}

std::optional<address_t> engine::payee() const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  return state.get<address_t>(key::make_singleton_key(key::kPayeeKey));
}

std::string engine::owner_of_function(const address_t& contract) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  return make_oracle(state).resolve_function(contract);
}

achievement_id_t engine::last_achievement_id() const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  return state
      .get<achievement_id_t>(
          key::make_singleton_key(key::kAchievementCounterKey))
      .value_or(achievement_id_t{0});
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto info = app_info_t{};
  info.last_height = last_committed_height_;
  info.last_state_root = last_committed_state_root_;
  return info;
}

std::vector<transaction_event_t> engine::events(
    const uint64_t from_sequence,
    const uint64_t to_sequence) const {
  auto lock = std::scoped_lock{mutex_};
  auto state = state_t{storage_, encoder_};
  auto count = state.get<uint64_t>(key::make_singleton_key(key::kEventSeqKey))
                   .value_or(0);
  auto first = std::max<uint64_t>(from_sequence, 1);
  auto last = std::min(to_sequence, count);

  auto out = std::vector<transaction_event_t>{};
  for (auto sequence = first; sequence <= last; ++sequence) {
    auto event = state.get<transaction_event_t>(key::make_event_key(sequence));
    if (!event.has_value()) {
      sigil::common::critical("persisted event sequence has a gap");
    }
    out.push_back(std::move(*event));
  }
  return out;
}

transaction_result_t engine::apply_mint(state_t& state,
                                        const admin_capability& admin,
                                        const mint_t& request) {
  if (admin.administrator() != options_.administrator) {
    return make_failure(transaction_error_code::authorization_denied,
                        to_hex(admin.administrator()));
  }
  auto achievement_id = achievement_id_t{};
  if (auto error = mint_one(state, request.to, request.amount, request.uri,
                            request.price, request.permanent, achievement_id)) {
    return make_failure(*error);
  }

  auto result = transaction_result_t{};
  result.data = encoder_.encode(achievement_id);
  result.events.push_back(transaction_event_t{
      .type = std::string{kMintEventType},
      .attributes = {make_attribute("operator", to_hex(admin.administrator())),
                     make_attribute("to", to_hex(request.to)),
                     make_attribute("achievementId", achievement_id.str()),
                     make_attribute("amount", request.amount.str(), false)}});
  spdlog::info("Minted achievement {} x{} to {}", achievement_id.str(),
               request.amount.str(), to_hex(request.to));
  return result;
}

transaction_result_t engine::apply_mint_batch(state_t& state,
                                              const admin_capability& admin,
                                              const mint_batch_t& request) {
  if (admin.administrator() != options_.administrator) {
    return make_failure(transaction_error_code::authorization_denied,
                        to_hex(admin.administrator()));
  }
  auto size = request.amounts.size();
  if (size == 0) {
    return make_failure(transaction_error_code::empty_batch);
  }
  if (request.uris.size() != size || request.prices.size() != size ||
      request.permanents.size() != size) {
    return make_failure(
        transaction_error_code::batch_length_mismatch,
        fmt::format("amounts={} uris={} prices={} permanents={}", size,
                    request.uris.size(), request.prices.size(),
                    request.permanents.size()));
  }

  auto result = transaction_result_t{};
  auto minted = std::vector<achievement_id_t>{};
  minted.reserve(size);
  for (std::size_t i = 0; i < size; ++i) {
    auto achievement_id = achievement_id_t{};
    if (auto error = mint_one(state, request.to, request.amounts[i],
                              request.uris[i], request.prices[i],
                              request.permanents[i], achievement_id)) {
      return make_failure(*error, fmt::format("batch entry {}", i));
    }
    minted.push_back(achievement_id);
    result.events.push_back(transaction_event_t{
        .type = std::string{kMintEventType},
        .attributes = {
            make_attribute("operator", to_hex(admin.administrator())),
            make_attribute("to", to_hex(request.to)),
            make_attribute("achievementId", achievement_id.str()),
            make_attribute("amount", request.amounts[i].str(), false)}});
  }
  result.data = encoder_.encode(minted);
  spdlog::info("Minted {} achievement(s) {}..{} to {}", size,
               minted.front().str(), minted.back().str(), to_hex(request.to));
  return result;
}

std::optional<transaction_error_code> engine::mint_one(
    state_t& state,
    const address_t& to,
    const amount_t& amount,
    const std::string& uri,
    const amount_t& price,
    const bool permanent,
    achievement_id_t& minted_id) {
  if (is_zero(to)) {
    return transaction_error_code::null_address;
  }
  if (amount == 0) {
    return transaction_error_code::invalid_amount;
  }
  if (price == 0) {
    return transaction_error_code::price_out_of_range;
  }
  auto word = try_pack(achievement_state_t{.price = price,
                                           .permanent = permanent});
  if (!word.has_value()) {
    return transaction_error_code::price_out_of_range;
  }

  auto counter_key = key::make_singleton_key(key::kAchievementCounterKey);
  auto last = state.get<achievement_id_t>(counter_key).value_or(0);
  if (last >= max_achievement_id()) {
    return transaction_error_code::achievement_id_exhausted;
  }
  minted_id = achievement_id_t{last + 1};

  state.put(counter_key, minted_id);
  state.put(key::make_achievement_key(minted_id), *word);
  if (!uri.empty()) {
    state.put(key::make_achievement_uri_key(minted_id), uri);
  }
  if (!sigil::ledger::balance_ledger{state}.mint(to, minted_id, amount)) {
    return transaction_error_code::invalid_amount;
  }
  return std::nullopt;
}

transaction_result_t engine::apply_bind(state_t& state,
                                        const address_t& caller,
                                        const bind_t& request) {
  if (caller == options_.ledger_address) {
    return make_failure(transaction_error_code::custody_caller,
                        to_hex(caller));
  }
  auto row = binding_row_key(request.contract, request.token_id,
                             request.achievement_id);
  if (!row.has_value()) {
    return make_failure(transaction_error_code::invalid_achievement_id,
                        request.achievement_id.str());
  }
  auto binding = state.get<binding_state_t>(*row);
  if (binding.has_value() && binding->bound) {
    return make_failure(transaction_error_code::already_bound);
  }

  auto balances = sigil::ledger::balance_ledger{state};
  if (balances.balance_of(caller, request.achievement_id) == 0) {
    return make_failure(transaction_error_code::insufficient_achievement_balance,
                        to_hex(caller));
  }
  if (auto denied = check_token_owner(state, request.contract,
                                      request.token_id, caller)) {
    return *denied;
  }

  if (!balances.transfer(caller, options_.ledger_address,
                         request.achievement_id, amount_t{1})) {
    sigil::common::critical("bind custody transfer failed after checks");
  }
  state.put(*row, binding_state_t{.bound = true, .uri = request.uri});

  auto result = transaction_result_t{};
  result.events.push_back(transaction_event_t{
      .type = std::string{kBindEventType},
      .attributes = {make_attribute("operator", to_hex(caller)),
                     make_attribute("contractAddress", to_hex(request.contract)),
                     make_attribute("tokenId", request.token_id.str()),
                     make_attribute("achievementId",
                                    request.achievement_id.str()),
                     make_attribute("uri", request.uri, false)}});
  spdlog::info("Bound achievement {} to {}:{}", request.achievement_id.str(),
               to_hex(request.contract), request.token_id.str());
  return result;
}

transaction_result_t engine::apply_unbind(state_t& state,
                                          const address_t& caller,
                                          const unbind_t& request) {
  if (caller == options_.ledger_address) {
    return make_failure(transaction_error_code::custody_caller,
                        to_hex(caller));
  }
  auto row = binding_row_key(request.contract, request.token_id,
                             request.achievement_id);
  if (!row.has_value()) {
    return make_failure(transaction_error_code::invalid_achievement_id,
                        request.achievement_id.str());
  }
  auto binding = state.get<binding_state_t>(*row);
  if (!binding.has_value() || !binding->bound) {
    return make_failure(transaction_error_code::not_bound);
  }
  auto achievement = load_achievement(state, request.achievement_id);
  if (!achievement.has_value()) {
    sigil::common::critical("bound achievement has no stored terms");
  }
  if (achievement->permanent) {
    return make_failure(transaction_error_code::permanently_bound);
  }
  if (auto denied = check_token_owner(state, request.contract,
                                      request.token_id, caller)) {
    return *denied;
  }

  state.erase(*row);
  if (!sigil::ledger::balance_ledger{state}.transfer(
          options_.ledger_address, caller, request.achievement_id,
          amount_t{1})) {
    sigil::common::critical("ledger custody does not hold the bound unit");
  }

  auto result = transaction_result_t{};
  result.events.push_back(transaction_event_t{
      .type = std::string{kUnbindEventType},
      .attributes = {make_attribute("operator", to_hex(caller)),
                     make_attribute("contractAddress", to_hex(request.contract)),
                     make_attribute("tokenId", request.token_id.str()),
                     make_attribute("achievementId",
                                    request.achievement_id.str())}});
  spdlog::info("Unbound achievement {} from {}:{}",
               request.achievement_id.str(), to_hex(request.contract),
               request.token_id.str());
  return result;
}

transaction_result_t engine::apply_purchase(state_t& state,
                                            const address_t& caller,
                                            const amount_t& value,
                                            const purchase_t& request) {
  if (!valid_achievement_id(request.achievement_id)) {
    return make_failure(transaction_error_code::invalid_achievement_id,
                        request.achievement_id.str());
  }
  if (is_zero(caller)) {
    return make_failure(transaction_error_code::null_address,
                        "caller must not be null");
  }
  if (caller == options_.ledger_address) {
    return make_failure(transaction_error_code::custody_caller,
                        to_hex(caller));
  }
  auto payee = state.get<address_t>(key::make_singleton_key(key::kPayeeKey));
  if (!payee.has_value()) {
    return make_failure(transaction_error_code::payee_not_configured);
  }

  auto balances = sigil::ledger::balance_ledger{state};
  if (balances.balance_of(options_.administrator, request.achievement_id) ==
      0) {
    return make_failure(transaction_error_code::achievement_sold_out,
                        request.achievement_id.str());
  }
  auto achievement = load_achievement(state, request.achievement_id);
  if (!achievement.has_value()) {
    sigil::common::critical("held achievement has no stored terms");
  }
  if (value != achievement->price) {
    return make_failure(transaction_error_code::payment_mismatch,
                        fmt::format("expected {} got {}",
                                    achievement->price.str(), value.str()));
  }

  if (!sigil::ledger::escrow{state}.deposit(*payee, value)) {
    return make_failure(transaction_error_code::invalid_amount,
                        "escrow deposit overflows");
  }
  if (!balances.transfer(options_.administrator, caller,
                         request.achievement_id, amount_t{1})) {
    sigil::common::critical("purchase transfer failed after checks");
  }

  auto result = transaction_result_t{};
  result.events.push_back(transaction_event_t{
      .type = std::string{kPurchaseEventType},
      .attributes = {make_attribute("operator", to_hex(caller)),
                     make_attribute("achievementId",
                                    request.achievement_id.str())}});
  spdlog::info("Achievement {} purchased by {} for {}",
               request.achievement_id.str(), to_hex(caller), value.str());
  return result;
}

std::optional<transaction_result_t> engine::check_token_owner(
    const state_t& state,
    const address_t& contract,
    const token_id_t& token_id,
    const address_t& caller) const {
  auto error = std::string{};
  auto owns = make_oracle(state).owns_token(contract, token_id, caller, error);
  if (!owns.has_value()) {
    return make_failure(transaction_error_code::ownership_resolution_failed,
                        error);
  }
  if (!*owns) {
    return make_failure(transaction_error_code::not_token_owner,
                        to_hex(caller));
  }
  return std::nullopt;
}

sigil::oracle::ownership_oracle engine::make_oracle(
    const state_t& state) const {
  return sigil::oracle::ownership_oracle{
      host_, [&state](const address_t& contract) {
        return state.get<std::string>(
            key::make_owner_of_function_key(contract));
      }};
}

void engine::commit(state_t& state,
                    const std::vector<transaction_event_t>& events) {
  auto sequence_key = key::make_singleton_key(key::kEventSeqKey);
  auto sequence = state.get<uint64_t>(sequence_key).value_or(0);

  auto material = bytes_t{};
  material.insert(std::end(material), std::begin(last_committed_state_root_),
                  std::end(last_committed_state_root_));
  for (const auto& event : events) {
    ++sequence;
    state.put(key::make_event_key(sequence), event);
    encoder_.encode(event, material);
  }
  if (!events.empty()) {
    state.put(sequence_key, sequence);
  }

  auto height = last_committed_height_ + 1;
  encoder_.encode(height, material);
  auto state_root =
      sigil::blake3::hash(bytes_view_t{material.data(), material.size()});

  storage_.commit_batch(
      state.entries(),
      sigil::storage::committed_state{.height = height,
                                      .state_root = state_root});
  last_committed_height_ = height;
  last_committed_state_root_ = state_root;
  spdlog::debug("Committed height {} with {} event(s)", height, events.size());
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted ledger state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  } else {
    last_committed_height_ = 0;
    last_committed_state_root_ = make_zero_hash();
  }
}

}  // namespace sigil::execution
