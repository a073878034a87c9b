#include <gtest/gtest.h>
#include <sigil/execution/engine.hpp>
#include <sigil/schema/transaction.hpp>
#include <sigil/schema/transaction_error_code.hpp>
#include <sigil/testing/ledger_fixture.hpp>

#include <string>

using namespace sigil::schema;
using namespace sigil::testing;

namespace {

bytes_view_t view(const bytes_t& bytes) {
  return bytes_view_t{bytes.data(), bytes.size()};
}

transaction_error_code code_of(const transaction_result_t& result) {
  return static_cast<transaction_error_code>(result.code);
}

}  // namespace

TEST(engine_transaction, administrator_mints_through_execute) {
  auto fixture = ledger_fixture{"sigil_tx_mint"};
  auto raw = fixture.encode(
      kAdmin, 0, mint_t{.to = kAlice, .amount = 3, .uri = "u", .price = 1});

  auto result = fixture.engine().execute(view(raw));
  ASSERT_TRUE(result.ok()) << result.log << " " << result.info;
  EXPECT_EQ(fixture.encoder().decode<achievement_id_t>(view(result.data)),
            achievement_id_t{1});
  EXPECT_EQ(fixture.engine().balance_of(kAlice, 1), amount_t{3});
}

TEST(engine_transaction, administrative_payloads_need_the_administrator) {
  auto fixture = ledger_fixture{"sigil_tx_denied"};
  auto& engine = fixture.engine();

  auto mint = engine.execute(view(
      fixture.encode(kAlice, 0, mint_t{.to = kAlice, .amount = 1})));
  EXPECT_EQ(code_of(mint), transaction_error_code::authorization_denied);
  EXPECT_EQ(mint.kind(), error_kind::authorization_failure);

  auto payee =
      engine.execute(view(fixture.encode(kBob, 0, set_payee_t{.payee = kBob})));
  EXPECT_EQ(payee.kind(), error_kind::authorization_failure);
  EXPECT_FALSE(engine.payee().has_value());

  auto owner_query = engine.execute(view(fixture.encode(
      kBob, 0,
      set_owner_of_function_t{.contract = kCollection,
                              .signature = "holderOf(uint256)"})));
  EXPECT_EQ(owner_query.kind(), error_kind::authorization_failure);
  EXPECT_EQ(engine.owner_of_function(kCollection), "ownerOf(uint256)");
  EXPECT_EQ(engine.last_achievement_id(), achievement_id_t{0});
}

TEST(engine_transaction, malformed_transactions_are_rejected) {
  auto fixture = ledger_fixture{"sigil_tx_malformed"};
  auto& engine = fixture.engine();

  auto empty = engine.execute(bytes_view_t{});
  EXPECT_EQ(code_of(empty), transaction_error_code::invalid_transaction);
  EXPECT_EQ(empty.codespace, "sigil.execute");

  auto garbage = bytes_t{0x01, 0x00, 0xFF};
  auto truncated = engine.execute(view(garbage));
  EXPECT_EQ(code_of(truncated), transaction_error_code::invalid_transaction);
  EXPECT_EQ(truncated.kind(), error_kind::precondition_violation);
}

TEST(engine_transaction, envelope_is_validated) {
  auto fixture = ledger_fixture{"sigil_tx_envelope"};
  auto& engine = fixture.engine();

  auto future = transaction_t{.version = 2,
                              .chain_id = fixture.chain_id(),
                              .caller = kAdmin,
                              .payload = mint_t{.to = kAlice, .amount = 1}};
  auto unsupported = engine.execute(view(fixture.encoder().encode(future)));
  EXPECT_EQ(code_of(unsupported),
            transaction_error_code::unsupported_transaction_version);

  auto foreign = transaction_t{.chain_id = make_hash(9),
                               .caller = kAdmin,
                               .payload = mint_t{.to = kAlice, .amount = 1}};
  auto wrong_chain = engine.execute(view(fixture.encoder().encode(foreign)));
  EXPECT_EQ(code_of(wrong_chain), transaction_error_code::invalid_chain_id);

  auto anonymous = engine.execute(view(fixture.encode(
      make_zero_address(), 0, purchase_t{.achievement_id = 1})));
  EXPECT_EQ(code_of(anonymous), transaction_error_code::null_address);

  EXPECT_EQ(engine.info().last_height, 0);
}

TEST(engine_transaction, value_is_only_accepted_by_purchases) {
  auto fixture = ledger_fixture{"sigil_tx_value"};
  auto& engine = fixture.engine();
  auto id = fixture.mint(kAdmin, 2, 50);
  ASSERT_TRUE(fixture.collection().mint(kAlice, 42));
  ASSERT_TRUE(
      engine.set_payee(fixture.admin(), set_payee_t{.payee = kPayee}).ok());

  auto paid_mint = engine.execute(view(
      fixture.encode(kAdmin, 1, mint_t{.to = kAlice, .amount = 1})));
  EXPECT_EQ(code_of(paid_mint), transaction_error_code::operation_not_payable);
  EXPECT_EQ(paid_mint.kind(), error_kind::precondition_violation);

  auto bought = engine.execute(
      view(fixture.encode(kAlice, 50, purchase_t{.achievement_id = id})));
  ASSERT_TRUE(bought.ok()) << bought.log << " " << bought.info;
  EXPECT_EQ(engine.deposits_of(kPayee), amount_t{50});

  auto paid_bind = engine.execute(view(fixture.encode(
      kAlice, 1,
      bind_t{.contract = kCollection, .token_id = 42, .achievement_id = id})));
  EXPECT_EQ(code_of(paid_bind), transaction_error_code::operation_not_payable);

  auto bound = engine.execute(view(fixture.encode(
      kAlice, 0,
      bind_t{.contract = kCollection, .token_id = 42, .achievement_id = id})));
  ASSERT_TRUE(bound.ok()) << bound.log << " " << bound.info;
  EXPECT_TRUE(engine.is_bound(kCollection, 42, id));

  auto unbound = engine.execute(view(fixture.encode(
      kAlice, 0,
      unbind_t{.contract = kCollection, .token_id = 42, .achievement_id = id})));
  ASSERT_TRUE(unbound.ok()) << unbound.log << " " << unbound.info;
  EXPECT_FALSE(engine.is_bound(kCollection, 42, id));
}

TEST(engine_transaction, purchase_and_bind_through_execute) {
  auto fixture = ledger_fixture{"sigil_tx_purchase_bind"};
  auto& engine = fixture.engine();
  auto id = fixture.mint(kAdmin, 1, 7);
  ASSERT_TRUE(fixture.collection().mint(kBob, 5));
  ASSERT_TRUE(engine
                  .execute(view(fixture.encode(kAdmin, 0,
                                               set_payee_t{.payee = kPayee})))
                  .ok());

  auto result = engine.execute(view(fixture.encode(
      kBob, 7,
      purchase_and_bind_t{.achievement_id = id,
                          .contract = kCollection,
                          .token_id = 5,
                          .uri = "ipfs://tx"})));
  ASSERT_TRUE(result.ok()) << result.log << " " << result.info;
  EXPECT_EQ(engine.binding_uri(kCollection, 5, id), std::string{"ipfs://tx"});
  EXPECT_EQ(engine.deposits_of(kPayee), amount_t{7});
}
