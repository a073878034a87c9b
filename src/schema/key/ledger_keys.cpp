#include <sigil/schema/key/ledger_keys.hpp>

#include <sigil/schema/encoding/scale/encoder.hpp>

#include <tuple>

namespace sigil::schema::key {

namespace {

using key_encoder_t =
    sigil::schema::encoding::encoder<sigil::schema::encoding::scale_encoder_tag>;

}  // namespace

sigil::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const sigil::schema::bytes_t& id) {
  // SCALE product types are encoded as concatenated field bytes, so this is
  // equivalent to encoding tuple{prefix, id}.
  auto key = key_encoder_t{}.encode(prefix);
  key.reserve(key.size() + id.size());
  key.insert(std::end(key), std::begin(id), std::end(id));
  return key;
}

sigil::schema::bytes_t make_singleton_key(std::string_view key) {
  return key_encoder_t{}.encode(key);
}

sigil::schema::bytes_t make_achievement_key(
    const sigil::schema::achievement_id_t& achievement_id) {
  return make_prefixed_key(kAchievementKeyPrefix,
                           key_encoder_t{}.encode(achievement_id));
}

sigil::schema::bytes_t make_achievement_uri_key(
    const sigil::schema::achievement_id_t& achievement_id) {
  return make_prefixed_key(kAchievementUriKeyPrefix,
                           key_encoder_t{}.encode(achievement_id));
}

sigil::schema::bytes_t make_binding_key(
    const binding_key_t& binding_key,
    const sigil::schema::token_id_t& token_id) {
  return make_prefixed_key(kBindingKeyPrefix,
                           key_encoder_t{}.encode(std::tuple{
                               sigil::schema::word_t{binding_key}, token_id}));
}

sigil::schema::bytes_t make_owner_of_function_key(
    const sigil::schema::address_t& contract) {
  return make_prefixed_key(kOwnerOfFunctionKeyPrefix,
                           key_encoder_t{}.encode(contract));
}

sigil::schema::bytes_t make_balance_key(
    const sigil::schema::address_t& account,
    const sigil::schema::achievement_id_t& achievement_id) {
  return make_prefixed_key(
      kBalanceKeyPrefix,
      key_encoder_t{}.encode(std::tuple{account, achievement_id}));
}

sigil::schema::bytes_t make_escrow_key(const sigil::schema::address_t& payee) {
  return make_prefixed_key(kEscrowKeyPrefix, key_encoder_t{}.encode(payee));
}

sigil::schema::bytes_t make_event_key(const uint64_t sequence) {
  return make_prefixed_key(kEventPrefix, key_encoder_t{}.encode(sequence));
}

}  // namespace sigil::schema::key
