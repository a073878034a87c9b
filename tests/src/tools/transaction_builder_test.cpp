#include <gtest/gtest.h>
#include <sigil/blake3/hash.hpp>
#include <sigil/schema/encoding/scale/encoder.hpp>
#include <sigil/schema/primitives.hpp>
#include <sigil/schema/transaction.hpp>

#include <array>
#include <cctype>
#include <cstdio>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

#include <sys/wait.h>

#ifndef SIGIL_TRANSACTION_BUILDER_PATH
#define SIGIL_TRANSACTION_BUILDER_PATH ""
#endif

namespace {

using encoder_t =
    sigil::schema::encoding::encoder<sigil::schema::encoding::scale_encoder_tag>;

constexpr auto kCaller = "0x1111111111111111111111111111111111111111";
constexpr auto kCollection = "0xc0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0c0";

std::string shell_quote(const std::string_view value) {
  auto out = std::string{"'"};
  for (const auto ch : value) {
    if (ch == '\'') {
      out += "'\\''";
    } else {
      out.push_back(ch);
    }
  }
  out.push_back('\'');
  return out;
}

std::string trim_ascii_whitespace(const std::string& input) {
  auto first = size_t{0};
  while (first < input.size() &&
         std::isspace(static_cast<unsigned char>(input[first])) != 0) {
    ++first;
  }
  auto last = input.size();
  while (last > first &&
         std::isspace(static_cast<unsigned char>(input[last - 1])) != 0) {
    --last;
  }
  return input.substr(first, last - first);
}

std::pair<int, std::string> run_capture(const std::string& command) {
  auto buffer = std::array<char, 256>{};
  auto output = std::string{};
  auto* pipe = popen(command.c_str(), "r");
  if (pipe == nullptr) {
    return {-1, {}};
  }
  while (fgets(buffer.data(), static_cast<int>(buffer.size()), pipe) !=
         nullptr) {
    output += buffer.data();
  }
  auto status = pclose(pipe);
  if (status == -1) {
    return {-1, output};
  }
  if (WIFEXITED(status) == 0) {
    return {-1, output};
  }
  return {WEXITSTATUS(status), output};
}

std::string run_builder(const std::string& builder,
                        const std::string_view args) {
  auto command = shell_quote(builder) + " " + std::string{args};
  auto [exit_code, output] = run_capture(command);
  EXPECT_EQ(exit_code, 0) << "command failed: " << command << '\n' << output;
  return trim_ascii_whitespace(output);
}

sigil::schema::transaction_t decode_transaction(const std::string& hex) {
  auto raw = sigil::schema::from_hex(hex);
  return encoder_t{}.decode<sigil::schema::transaction_t>(
      sigil::schema::bytes_view_t{raw.data(), raw.size()});
}

std::string builder_path() {
  return std::string{SIGIL_TRANSACTION_BUILDER_PATH};
}

}  // namespace

TEST(transaction_builder, chain_id_defaults_to_hashed_seed) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto expected = sigil::blake3::hash(sigil::schema::kDefaultChainIdSeed);
  EXPECT_EQ(run_builder(builder, "chain-id"),
            sigil::schema::to_hex(
                sigil::schema::bytes_view_t{expected.data(), expected.size()}));
}

TEST(transaction_builder, mint_transaction_decodes_to_requested_fields) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto hex = run_builder(
      builder, "transaction --payload mint --caller " + std::string{kCaller} +
                   " --to " + std::string{kCollection} +
                   " --amount 5 --price 0x64 --permanent true --uri ipfs://a");
  auto tx = decode_transaction(hex);
  EXPECT_EQ(tx.version, 1);
  EXPECT_EQ(tx.caller, sigil::schema::make_address(kCaller));
  EXPECT_EQ(tx.value, sigil::schema::amount_t{0});
  EXPECT_EQ(tx.chain_id,
            sigil::blake3::hash(sigil::schema::kDefaultChainIdSeed));

  ASSERT_TRUE(std::holds_alternative<sigil::schema::mint_t>(tx.payload));
  const auto& mint = std::get<sigil::schema::mint_t>(tx.payload);
  EXPECT_EQ(mint.to, sigil::schema::make_address(kCollection));
  EXPECT_EQ(mint.amount, sigil::schema::amount_t{5});
  EXPECT_EQ(mint.price, sigil::schema::amount_t{100});
  EXPECT_TRUE(mint.permanent);
  EXPECT_EQ(mint.uri, "ipfs://a");
}

TEST(transaction_builder, purchase_and_bind_carries_value) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto hex = run_builder(
      builder, "transaction --payload purchase_and_bind --caller " +
                   std::string{kCaller} + " --value 250 --achievement-id 3" +
                   " --contract " + std::string{kCollection} +
                   " --token-id 42 --uri ipfs://b");
  auto tx = decode_transaction(hex);
  EXPECT_EQ(tx.value, sigil::schema::amount_t{250});
  ASSERT_TRUE(
      std::holds_alternative<sigil::schema::purchase_and_bind_t>(tx.payload));
  const auto& payload = std::get<sigil::schema::purchase_and_bind_t>(tx.payload);
  EXPECT_EQ(payload.achievement_id, sigil::schema::achievement_id_t{3});
  EXPECT_EQ(payload.contract, sigil::schema::make_address(kCollection));
  EXPECT_EQ(payload.token_id, sigil::schema::token_id_t{42});
  EXPECT_EQ(payload.uri, "ipfs://b");
}

TEST(transaction_builder, mint_batch_preserves_entry_order) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto hex = run_builder(
      builder, "transaction --payload mint_batch --caller " +
                   std::string{kCaller} + " --to " + std::string{kCaller} +
                   " --amounts 1 2 --uris a b --prices 10 20"
                   " --permanents false true");
  auto tx = decode_transaction(hex);
  ASSERT_TRUE(std::holds_alternative<sigil::schema::mint_batch_t>(tx.payload));
  const auto& batch = std::get<sigil::schema::mint_batch_t>(tx.payload);
  ASSERT_EQ(batch.amounts.size(), 2u);
  EXPECT_EQ(batch.amounts[1], sigil::schema::amount_t{2});
  EXPECT_EQ(batch.uris[0], "a");
  EXPECT_EQ(batch.prices[1], sigil::schema::amount_t{20});
  EXPECT_FALSE(batch.permanents[0]);
  EXPECT_TRUE(batch.permanents[1]);
}

TEST(transaction_builder, owner_query_override_payload) {
  auto builder = builder_path();
  if (builder.empty() || !std::filesystem::exists(builder)) {
    GTEST_SKIP() << "transaction builder binary not available: " << builder;
  }

  auto hex = run_builder(
      builder, "transaction --payload set_owner_of_function --caller " +
                   std::string{kCaller} + " --contract " +
                   std::string{kCollection} +
                   " --signature " + shell_quote("holderOf(uint256)"));
  auto tx = decode_transaction(hex);
  ASSERT_TRUE(std::holds_alternative<sigil::schema::set_owner_of_function_t>(
      tx.payload));
  EXPECT_EQ(std::get<sigil::schema::set_owner_of_function_t>(tx.payload)
                .signature,
            "holderOf(uint256)");
}
