#pragma once

#include <sigil/schema/key/binding_key.hpp>
#include <sigil/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: ledger keys.
// Canonical key prefixes and key builders for every piece of ledger state.
namespace sigil::schema::key {

inline constexpr std::string_view kAchievementCounterKey{
    "SYS|STATE|ACHIEVEMENT_COUNTER"};
inline constexpr std::string_view kAchievementKeyPrefix{
    "SYS|STATE|ACHIEVEMENT|"};
inline constexpr std::string_view kAchievementUriKeyPrefix{
    "SYS|STATE|ACHIEVEMENT_URI|"};
inline constexpr std::string_view kBindingKeyPrefix{"SYS|STATE|BINDING|"};
inline constexpr std::string_view kOwnerOfFunctionKeyPrefix{
    "SYS|STATE|OWNER_OF_FUNCTION|"};
inline constexpr std::string_view kBalanceKeyPrefix{"SYS|STATE|BALANCE|"};
inline constexpr std::string_view kEscrowKeyPrefix{"SYS|STATE|ESCROW|"};
inline constexpr std::string_view kPayeeKey{"SYS|STATE|PAYEE"};
inline constexpr std::string_view kEventSeqKey{"SYS|STATE|EVENT_SEQ"};
inline constexpr std::string_view kEventPrefix{"SYS|EVENT|"};

/// Every keyspace the ledger writes; none is a key prefix of another.
inline const std::array<std::string_view, 10> kLedgerKeyspaces{
    kAchievementCounterKey,
    kAchievementKeyPrefix,
    kAchievementUriKeyPrefix,
    kBindingKeyPrefix,
    kOwnerOfFunctionKeyPrefix,
    kBalanceKeyPrefix,
    kEscrowKeyPrefix,
    kPayeeKey,
    kEventSeqKey,
    kEventPrefix};

sigil::schema::bytes_t make_prefixed_key(std::string_view prefix,
                                         const sigil::schema::bytes_t& id);
sigil::schema::bytes_t make_singleton_key(std::string_view key);

sigil::schema::bytes_t make_achievement_key(
    const sigil::schema::achievement_id_t& achievement_id);
sigil::schema::bytes_t make_achievement_uri_key(
    const sigil::schema::achievement_id_t& achievement_id);

/// Binding table row: (composite binding key, external token id).
sigil::schema::bytes_t make_binding_key(
    const binding_key_t& binding_key,
    const sigil::schema::token_id_t& token_id);

sigil::schema::bytes_t make_owner_of_function_key(
    const sigil::schema::address_t& contract);
sigil::schema::bytes_t make_balance_key(
    const sigil::schema::address_t& account,
    const sigil::schema::achievement_id_t& achievement_id);
sigil::schema::bytes_t make_escrow_key(const sigil::schema::address_t& payee);
sigil::schema::bytes_t make_event_key(uint64_t sequence);

}  // namespace sigil::schema::key
