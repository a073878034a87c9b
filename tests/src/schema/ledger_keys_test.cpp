#include <gtest/gtest.h>
#include <sigil/schema/key/binding_key.hpp>
#include <sigil/schema/key/ledger_keys.hpp>
#include <sigil/testing/common.hpp>

#include <algorithm>
#include <string_view>
#include <utility>
#include <vector>

using namespace sigil::schema;
using sigil::testing::make_address;

namespace {

bool starts_with(const bytes_t& bytes, const bytes_t& prefix) {
  return bytes.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(bytes));
}

}  // namespace

TEST(ledger_keys, keyspaces_never_prefix_each_other) {
  for (size_t i = 0; i < key::kLedgerKeyspaces.size(); ++i) {
    for (size_t j = 0; j < key::kLedgerKeyspaces.size(); ++j) {
      if (i == j) {
        continue;
      }
      auto outer = key::make_singleton_key(key::kLedgerKeyspaces[i]);
      auto inner = key::make_singleton_key(key::kLedgerKeyspaces[j]);
      EXPECT_FALSE(starts_with(inner, outer))
          << key::kLedgerKeyspaces[i] << " prefixes "
          << key::kLedgerKeyspaces[j];
    }
  }
}

TEST(ledger_keys, builders_stay_inside_their_keyspace) {
  auto alice = make_address(0x11);
  auto binding = key::encode_binding_key(make_address(0xC0), achievement_id_t{3});
  auto cases = std::vector<std::pair<bytes_t, std::string_view>>{
      {key::make_achievement_key(3), key::kAchievementKeyPrefix},
      {key::make_achievement_uri_key(3), key::kAchievementUriKeyPrefix},
      {key::make_binding_key(binding, 42), key::kBindingKeyPrefix},
      {key::make_owner_of_function_key(alice), key::kOwnerOfFunctionKeyPrefix},
      {key::make_balance_key(alice, 3), key::kBalanceKeyPrefix},
      {key::make_escrow_key(alice), key::kEscrowKeyPrefix},
      {key::make_event_key(1), key::kEventPrefix}};

  for (const auto& [built, keyspace] : cases) {
    for (const auto candidate : key::kLedgerKeyspaces) {
      EXPECT_EQ(starts_with(built, key::make_singleton_key(candidate)),
                candidate == keyspace)
          << keyspace << " key checked against " << candidate;
    }
  }
}
