#include <gtest/gtest.h>
#include <sigil/oracle/contract_host.hpp>
#include <sigil/oracle/ownership_oracle.hpp>
#include <sigil/oracle/ownership_source.hpp>
#include <sigil/testing/common.hpp>

#include <map>
#include <optional>
#include <string>
#include <utility>

using namespace sigil::schema;
using sigil::testing::make_address;

namespace {

/// Host returning one canned result and recording the last call.
class scripted_host final : public sigil::oracle::contract_host {
 public:
  explicit scripted_host(sigil::oracle::call_result result)
      : result_{std::move(result)} {}

  sigil::oracle::call_result static_call(
      const address_t& contract,
      const sigil::oracle::function_selector_t& selector,
      const bytes_view_t& arguments) const override {
    ++calls;
    last_contract = contract;
    last_selector = selector;
    last_arguments = bytes_t{std::begin(arguments), std::end(arguments)};
    return result_;
  }

  mutable int calls{};
  mutable address_t last_contract{};
  mutable sigil::oracle::function_selector_t last_selector{};
  mutable bytes_t last_arguments;

 private:
  sigil::oracle::call_result result_;
};

sigil::oracle::call_result owner_result(const address_t& owner) {
  return sigil::oracle::call_result{
      .status = sigil::oracle::call_status::success,
      .output = sigil::oracle::encode_address_result(owner)};
}

sigil::oracle::owner_of_function_lookup_t no_overrides() {
  return [](const address_t&) { return std::optional<std::string>{}; };
}

}  // namespace

TEST(ownership_oracle, default_query_reports_owner) {
  auto owner = make_address(0x11);
  auto host = scripted_host{owner_result(owner)};
  auto oracle = sigil::oracle::ownership_oracle{host, no_overrides()};

  auto error = std::string{};
  auto owns = oracle.owns_token(make_address(0xC0), 42, owner, error);
  ASSERT_TRUE(owns.has_value()) << error;
  EXPECT_TRUE(*owns);
  EXPECT_EQ(host.last_contract, make_address(0xC0));
  EXPECT_EQ(host.last_selector, sigil::oracle::make_selector("ownerOf(uint256)"));
  ASSERT_EQ(host.last_arguments.size(), 32u);
  EXPECT_EQ(host.last_arguments[31], 42);
  EXPECT_EQ(host.last_arguments[0], 0);
}

TEST(ownership_oracle, different_owner_is_not_an_error) {
  auto host = scripted_host{owner_result(make_address(0x22))};
  auto oracle = sigil::oracle::ownership_oracle{host, no_overrides()};

  auto error = std::string{};
  auto owns = oracle.owns_token(make_address(0xC0), 1, make_address(0x11), error);
  ASSERT_TRUE(owns.has_value());
  EXPECT_FALSE(*owns);
}

TEST(ownership_oracle, override_signature_selects_custom_query) {
  auto collection = make_address(0xC0);
  auto host = scripted_host{owner_result(make_address(0x11))};
  auto overrides = std::map<address_t, std::string>{
      {collection, "holderOf(uint256)"}};
  auto oracle = sigil::oracle::ownership_oracle{
      host, [&overrides](const address_t& contract) {
        auto it = overrides.find(contract);
        return it == std::end(overrides) ? std::optional<std::string>{}
                                         : std::optional{it->second};
      }};

  EXPECT_EQ(oracle.resolve_function(collection), "holderOf(uint256)");
  EXPECT_EQ(oracle.resolve_function(make_address(0xC1)), "ownerOf(uint256)");
  EXPECT_EQ(oracle.resolve_source(collection)->signature(),
            "holderOf(uint256)");

  auto error = std::string{};
  ASSERT_TRUE(oracle.owns_token(collection, 7, make_address(0x11), error));
  EXPECT_EQ(host.last_selector,
            sigil::oracle::make_selector("holderOf(uint256)"));
}

TEST(ownership_oracle, null_contract_fails_without_calling) {
  auto host = scripted_host{owner_result(make_address(0x11))};
  auto oracle = sigil::oracle::ownership_oracle{host, no_overrides()};

  auto error = std::string{};
  EXPECT_FALSE(oracle.owns_token(make_zero_address(), 1, make_address(0x11),
                                 error));
  EXPECT_FALSE(error.empty());
  EXPECT_EQ(host.calls, 0);
}

TEST(ownership_oracle, reverted_and_missing_contracts_are_failures) {
  for (const auto status : {sigil::oracle::call_status::reverted,
                            sigil::oracle::call_status::no_contract}) {
    auto host = scripted_host{sigil::oracle::call_result{.status = status}};
    auto oracle = sigil::oracle::ownership_oracle{host, no_overrides()};
    auto error = std::string{};
    EXPECT_FALSE(
        oracle.owns_token(make_address(0xC0), 1, make_address(0x11), error));
    EXPECT_FALSE(error.empty());
  }
}

TEST(ownership_oracle, unrecognised_call_status_is_a_failure) {
  auto owner = make_address(0x11);
  auto result = owner_result(owner);
  result.status = static_cast<sigil::oracle::call_status>(7);
  auto host = scripted_host{result};
  auto oracle = sigil::oracle::ownership_oracle{host, no_overrides()};

  auto error = std::string{};
  EXPECT_FALSE(oracle.owns_token(make_address(0xC0), 1, owner, error));
  EXPECT_NE(error.find("unknown call status 7"), std::string::npos) << error;
  EXPECT_EQ(host.calls, 1);
}

TEST(ownership_oracle, undecodable_payloads_are_failures) {
  auto short_output = bytes_t(31, 0);
  auto dirty_padding = sigil::oracle::encode_address_result(make_address(0x11));
  dirty_padding[0] = 0x01;

  for (const auto& output : {short_output, dirty_padding}) {
    auto host = scripted_host{sigil::oracle::call_result{
        .status = sigil::oracle::call_status::success, .output = output}};
    auto oracle = sigil::oracle::ownership_oracle{host, no_overrides()};
    auto error = std::string{};
    EXPECT_FALSE(
        oracle.owns_token(make_address(0xC0), 1, make_address(0x11), error));
  }
}

TEST(contract_host_codec, address_result_ignores_trailing_words) {
  auto output = sigil::oracle::encode_address_result(make_address(0x33));
  output.resize(64, 0xEE);
  auto decoded = sigil::oracle::decode_address_result(
      bytes_view_t{output.data(), output.size()});
  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, make_address(0x33));
}

TEST(contract_host_codec, token_id_argument_is_big_endian) {
  auto token_id = (token_id_t{1} << 255) | token_id_t{0x0102};
  auto encoded = sigil::oracle::encode_token_id_argument(token_id);
  ASSERT_EQ(encoded.size(), 32u);
  EXPECT_EQ(encoded[0], 0x80);
  EXPECT_EQ(encoded[30], 0x01);
  EXPECT_EQ(encoded[31], 0x02);
  EXPECT_EQ(sigil::oracle::decode_token_id_argument(
                bytes_view_t{encoded.data(), encoded.size()}),
            token_id);
  EXPECT_FALSE(sigil::oracle::decode_token_id_argument(
      bytes_view_t{encoded.data(), 31}));
}
