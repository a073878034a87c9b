#include <boost/program_options.hpp>
#include <sigil/blake3/hash.hpp>
#include <sigil/common/critical.hpp>
#include <sigil/schema/encoding/scale/encoder.hpp>
#include <sigil/schema/transaction.hpp>

#include <iostream>
#include <iterator>
#include <limits>
#include <string>
#include <string_view>
#include <vector>

namespace {

using encoder_t =
    sigil::schema::encoding::encoder<sigil::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

std::string required(const po::variables_map& vm, const std::string& name) {
  if (!vm.contains(name)) {
    sigil::common::critical("missing required argument --" + name);
  }
  return vm[name].as<std::string>();
}

sigil::schema::address_t get_address(const po::variables_map& vm,
                                     const std::string& name) {
  auto address = sigil::schema::try_make_address(required(vm, name));
  if (!address) {
    sigil::common::critical("--" + name + " must be 20 hex encoded bytes");
  }
  return *address;
}

sigil::schema::word_t parse_word(const std::string& text,
                                 const std::string_view name) {
  auto word = sigil::schema::try_make_word(text);
  if (!word) {
    sigil::common::critical(std::string{name} +
                            " must be a decimal or 0x hex 256-bit value");
  }
  return *word;
}

sigil::schema::word_t get_word(const po::variables_map& vm,
                               const std::string& name) {
  return parse_word(required(vm, name), name);
}

sigil::schema::achievement_id_t get_achievement_id(
    const po::variables_map& vm) {
  auto word = get_word(vm, "achievement-id");
  if (word > sigil::schema::word_t{std::numeric_limits<
                 sigil::schema::achievement_id_t>::max()}) {
    sigil::common::critical("--achievement-id is out of range");
  }
  return static_cast<sigil::schema::achievement_id_t>(word);
}

std::vector<std::string> get_list(const po::variables_map& vm,
                                  const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

std::vector<sigil::schema::amount_t> get_word_list(const po::variables_map& vm,
                                                   const std::string& name) {
  auto out = std::vector<sigil::schema::amount_t>{};
  for (const auto& value : get_list(vm, name)) {
    out.push_back(parse_word(value, name));
  }
  return out;
}

bool parse_flag(const std::string& text) {
  if (text == "true" || text == "1") {
    return true;
  }
  if (text == "false" || text == "0") {
    return false;
  }
  sigil::common::critical("flags must be true|false");
}

sigil::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = required(vm, "payload");
  if (payload == "mint") {
    return sigil::schema::mint_t{
        .to = get_address(vm, "to"),
        .amount = get_word(vm, "amount"),
        .uri = vm["uri"].as<std::string>(),
        .price = get_word(vm, "price"),
        .permanent = vm["permanent"].as<bool>()};
  }
  if (payload == "mint_batch") {
    auto permanents = std::vector<bool>{};
    for (const auto& value : get_list(vm, "permanents")) {
      permanents.push_back(parse_flag(value));
    }
    return sigil::schema::mint_batch_t{.to = get_address(vm, "to"),
                                       .amounts = get_word_list(vm, "amounts"),
                                       .uris = get_list(vm, "uris"),
                                       .prices = get_word_list(vm, "prices"),
                                       .permanents = permanents};
  }
  if (payload == "bind") {
    return sigil::schema::bind_t{.contract = get_address(vm, "contract"),
                                 .token_id = get_word(vm, "token-id"),
                                 .achievement_id = get_achievement_id(vm),
                                 .uri = vm["uri"].as<std::string>()};
  }
  if (payload == "unbind") {
    return sigil::schema::unbind_t{.contract = get_address(vm, "contract"),
                                   .token_id = get_word(vm, "token-id"),
                                   .achievement_id = get_achievement_id(vm)};
  }
  if (payload == "purchase") {
    return sigil::schema::purchase_t{.achievement_id = get_achievement_id(vm)};
  }
  if (payload == "purchase_and_bind") {
    return sigil::schema::purchase_and_bind_t{
        .achievement_id = get_achievement_id(vm),
        .contract = get_address(vm, "contract"),
        .token_id = get_word(vm, "token-id"),
        .uri = vm["uri"].as<std::string>()};
  }
  if (payload == "set_payee") {
    return sigil::schema::set_payee_t{.payee = get_address(vm, "payee")};
  }
  if (payload == "set_owner_of_function") {
    return sigil::schema::set_owner_of_function_t{
        .contract = get_address(vm, "contract"),
        .signature = vm["signature"].as<std::string>()};
  }
  sigil::common::critical("unsupported payload type");
}

sigil::schema::hash32_t get_chain_id(const po::variables_map& vm) {
  if (!vm.contains("chain-id")) {
    return sigil::blake3::hash(sigil::schema::kDefaultChainIdSeed);
  }
  auto chain_id =
      sigil::schema::try_make_hash32(vm["chain-id"].as<std::string>());
  if (!chain_id) {
    sigil::common::critical("--chain-id must be 32 hex encoded bytes");
  }
  return *chain_id;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  sigil_transaction_builder transaction --payload <type> "
               "[options]\n"
            << "  sigil_transaction_builder chain-id\n\n"
            << "Payload types: mint mint_batch bind unbind purchase "
               "purchase_and_bind set_payee set_owner_of_function\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"sigil_transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command), "transaction|chain-id")(
      "payload", po::value<std::string>(), "transaction payload type")(
      "chain-id", po::value<std::string>(), "32-byte chain id hex")(
      "caller", po::value<std::string>(), "caller address hex")(
      "value", po::value<std::string>()->default_value("0"),
      "settlement value sent with the transaction")(
      "to", po::value<std::string>(), "mint recipient address hex")(
      "amount", po::value<std::string>(), "mint amount")(
      "price", po::value<std::string>(), "mint price, at least 1")(
      "permanent", po::value<bool>()->default_value(false),
      "bindings of the minted achievement are permanent")(
      "uri", po::value<std::string>()->default_value(""), "metadata uri")(
      "amounts", po::value<std::vector<std::string>>()->multitoken(),
      "batch amounts")("uris",
                       po::value<std::vector<std::string>>()->multitoken(),
                       "batch uris")(
      "prices", po::value<std::vector<std::string>>()->multitoken(),
      "batch prices")("permanents",
                      po::value<std::vector<std::string>>()->multitoken(),
                      "batch permanence flags")(
      "contract", po::value<std::string>(), "external contract address hex")(
      "token-id", po::value<std::string>(), "external token id")(
      "achievement-id", po::value<std::string>(), "achievement id")(
      "payee", po::value<std::string>(), "payee address hex")(
      "signature", po::value<std::string>()->default_value(""),
      "owner query signature, empty to clear");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    auto transaction = sigil::schema::transaction_t{
        .version = 1,
        .chain_id = get_chain_id(vm),
        .caller = get_address(vm, "caller"),
        .value = get_word(vm, "value"),
        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << sigil::schema::to_hex(sigil::schema::bytes_view_t{
                     encoded.data(), encoded.size()})
              << '\n';
    return 0;
  }

  if (command == "chain-id") {
    auto chain_id = get_chain_id(vm);
    std::cout << sigil::schema::to_hex(sigil::schema::bytes_view_t{
                     chain_id.data(), chain_id.size()})
              << '\n';
    return 0;
  }

  sigil::common::critical("command must be transaction|chain-id");
}
