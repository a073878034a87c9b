#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <boost/program_options.hpp>
#include <sigil/blake3/hash.hpp>
#include <sigil/execution/engine.hpp>
#include <sigil/host/registry.hpp>
#include <sigil/host/unique_asset_ledger.hpp>
#include <sigil/ledger/state.hpp>
#include <sigil/oracle/ownership_source.hpp>
#include <sigil/schema/primitives.hpp>
#include <sigil/schema/transaction.hpp>
#include <fstream>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

namespace po = boost::program_options;
using sigil::schema::address_t;

struct token_seed final {
  address_t contract{};
  sigil::schema::token_id_t token_id{};
  address_t owner{};
};

// contract:tokenId:owner
std::optional<token_seed> parse_token_seed(const std::string& text) {
  auto first = text.find(':');
  auto second = text.find(':', first == std::string::npos ? 0 : first + 1);
  if (first == std::string::npos || second == std::string::npos) {
    return std::nullopt;
  }
  auto contract = sigil::schema::try_make_address(text.substr(0, first));
  auto token_id = sigil::schema::try_make_word(
      std::string_view{text}.substr(first + 1, second - first - 1));
  auto owner = sigil::schema::try_make_address(text.substr(second + 1));
  if (!contract || !token_id || !owner) {
    return std::nullopt;
  }
  return token_seed{.contract = *contract, .token_id = *token_id,
                    .owner = *owner};
}

// contract=signature
std::optional<std::pair<address_t, std::string>> parse_signature_seed(
    const std::string& text) {
  auto split = text.find('=');
  if (split == std::string::npos || split + 1 == text.size()) {
    return std::nullopt;
  }
  auto contract = sigil::schema::try_make_address(text.substr(0, split));
  if (!contract) {
    return std::nullopt;
  }
  return std::pair{*contract, text.substr(split + 1)};
}

void configure_logging(const std::string& level, const std::string& log_file) {
  spdlog::init_thread_pool(8192, 1);

  auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
  auto sinks = std::vector<spdlog::sink_ptr>{console_sink};
  if (!log_file.empty()) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
  }

  auto logger = std::make_shared<spdlog::async_logger>(
      "sigil", std::begin(sinks), std::end(sinks), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::from_str(level));
}

/// Deploy one unique-asset ledger per seeded contract, answering the default
/// owner query plus any extra signatures configured for it.
bool seed_registry(sigil::host::registry& registry,
                   const std::vector<std::string>& token_seeds,
                   const std::vector<std::string>& signature_seeds) {
  auto signatures = std::map<address_t, std::vector<std::string>>{};
  for (const auto& text : signature_seeds) {
    auto seed = parse_signature_seed(text);
    if (!seed) {
      spdlog::error("Invalid owner-of-signature '{}'", text);
      return false;
    }
    signatures[seed->first].push_back(seed->second);
  }

  auto ledgers =
      std::map<address_t, std::shared_ptr<sigil::host::unique_asset_ledger>>{};
  for (const auto& text : token_seeds) {
    auto seed = parse_token_seed(text);
    if (!seed) {
      spdlog::error("Invalid external-token '{}'", text);
      return false;
    }
    auto& ledger = ledgers[seed->contract];
    if (!ledger) {
      auto owner_queries = std::vector<std::string>{
          std::string{sigil::oracle::kDefaultOwnerOfSignature}};
      auto extra = signatures.find(seed->contract);
      if (extra != std::end(signatures)) {
        owner_queries.insert(std::end(owner_queries),
                             std::begin(extra->second),
                             std::end(extra->second));
      }
      ledger = std::make_shared<sigil::host::unique_asset_ledger>(
          std::move(owner_queries));
    }
    if (!ledger->mint(seed->owner, seed->token_id)) {
      spdlog::error("Could not seed external token '{}'", text);
      return false;
    }
  }

  for (const auto& [address, ledger] : ledgers) {
    registry.deploy(address, ledger);
    spdlog::info("Deployed unique asset ledger at {}",
                 sigil::schema::to_hex(address));
  }
  return true;
}

/// Apply hex encoded transactions, one per line; blank lines and lines
/// starting with '#' are skipped. Returns the number of rejected lines.
std::size_t apply_transactions(sigil::execution::engine& engine,
                               std::istream& input) {
  auto rejected = std::size_t{0};
  auto line = std::string{};
  auto line_number = std::size_t{0};
  while (std::getline(input, line)) {
    ++line_number;
    if (line.empty() || line.front() == '#') {
      continue;
    }
    auto raw = sigil::schema::try_from_hex(line);
    if (!raw) {
      spdlog::error("Line {}: not hex encoded", line_number);
      ++rejected;
      continue;
    }
    auto result = engine.execute(
        sigil::schema::bytes_view_t{raw->data(), raw->size()});
    if (result.ok()) {
      spdlog::info("Line {}: ok ({} event(s))", line_number,
                   result.events.size());
    } else {
      spdlog::warn("Line {}: [{}] code={} {} {}", line_number,
                   result.codespace, result.code, result.log, result.info);
      ++rejected;
    }
  }
  return rejected;
}

}  // namespace

int main(int argc, char* argv[]) {
  auto config_path = std::string{};
  auto db_path = std::string{};
  auto admin_hex = std::string{};
  auto ledger_hex = std::string{};
  auto chain_id_hex = std::string{};
  auto log_level = std::string{};
  auto log_file = std::string{};
  auto transactions_path = std::string{};

  auto description = po::options_description{"Sigil"};
  description.add_options()("help,h", "Show the help message")(
      "config,c", po::value<std::string>(&config_path),
      "INI style configuration file")(
      "db-path", po::value<std::string>(&db_path)->default_value("sigil.db"),
      "RocksDB directory")("admin", po::value<std::string>(&admin_hex),
                           "administrator address (20 byte hex)")(
      "ledger-address", po::value<std::string>(&ledger_hex),
      "the ledger's own custody address (20 byte hex)")(
      "chain-id", po::value<std::string>(&chain_id_hex),
      "32 byte chain id hex; defaults to the hash of the default seed")(
      "log-level", po::value<std::string>(&log_level)->default_value("info"),
      "trace|debug|info|warn|error|critical|off")(
      "log-file", po::value<std::string>(&log_file)->default_value("sigil.log"),
      "log file path, empty to disable")(
      "external-token",
      po::value<std::vector<std::string>>()->composing(),
      "seed an external token as contract:tokenId:owner")(
      "owner-of-signature",
      po::value<std::vector<std::string>>()->composing(),
      "extra owner query answered by a seeded contract, contract=signature")(
      "transactions", po::value<std::string>(&transactions_path),
      "file of hex encoded transactions, one per line");

  auto vm = po::variables_map{};
  try {
    po::store(po::parse_command_line(argc, argv, description), vm);
    po::notify(vm);
    if (!config_path.empty()) {
      po::store(po::parse_config_file<char>(config_path.c_str(), description),
                vm);
      po::notify(vm);
    }
  } catch (const po::error& ex) {
    std::cerr << ex.what() << '\n' << description << std::endl;
    return 2;
  }

  if (vm.contains("help")) {
    std::cout << description << std::endl;
    return 0;
  }

  configure_logging(log_level, log_file);

  auto admin = sigil::schema::try_make_address(admin_hex);
  auto ledger_address = sigil::schema::try_make_address(ledger_hex);
  if (!admin || !ledger_address || sigil::schema::is_zero(*admin) ||
      sigil::schema::is_zero(*ledger_address) || *admin == *ledger_address) {
    spdlog::error(
        "--admin and --ledger-address must be distinct non-null addresses");
    spdlog::shutdown();
    return 2;
  }
  auto chain_id =
      chain_id_hex.empty()
          ? std::optional{sigil::blake3::hash(sigil::schema::kDefaultChainIdSeed)}
          : sigil::schema::try_make_hash32(chain_id_hex);
  if (!chain_id) {
    spdlog::error("--chain-id must be 32 hex encoded bytes");
    spdlog::shutdown();
    return 2;
  }

  auto registry = sigil::host::registry{};
  auto token_seeds = vm.contains("external-token")
                         ? vm["external-token"].as<std::vector<std::string>>()
                         : std::vector<std::string>{};
  auto signature_seeds =
      vm.contains("owner-of-signature")
          ? vm["owner-of-signature"].as<std::vector<std::string>>()
          : std::vector<std::string>{};
  if (!seed_registry(registry, token_seeds, signature_seeds)) {
    spdlog::shutdown();
    return 2;
  }

  auto encoder = sigil::ledger::encoder_t{};
  auto storage =
      sigil::storage::make_storage<sigil::storage::rocksdb_storage_tag>(
          db_path);
  auto engine = sigil::execution::engine{
      encoder, storage, registry,
      sigil::execution::engine_options{.administrator = *admin,
                                       .ledger_address = *ledger_address,
                                       .chain_id = *chain_id}};

  auto rejected = std::size_t{0};
  if (!transactions_path.empty()) {
    auto input = std::ifstream{transactions_path};
    if (!input) {
      spdlog::error("Cannot open transactions file '{}'", transactions_path);
      spdlog::shutdown();
      return 2;
    }
    rejected = apply_transactions(engine, input);
  }

  auto info = engine.info();
  std::cout << "height " << info.last_height << '\n'
            << "state_root "
            << sigil::schema::to_hex(sigil::schema::bytes_view_t{
                   info.last_state_root.data(), info.last_state_root.size()})
            << std::endl;

  spdlog::shutdown();
  return rejected == 0 ? 0 : 1;
}
