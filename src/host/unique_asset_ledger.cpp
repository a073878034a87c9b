#include <sigil/host/unique_asset_ledger.hpp>
#include <sigil/oracle/ownership_source.hpp>

namespace sigil::host {

unique_asset_ledger::unique_asset_ledger()
    : unique_asset_ledger(std::vector<std::string>{
          std::string{sigil::oracle::kDefaultOwnerOfSignature}}) {}

unique_asset_ledger::unique_asset_ledger(
    std::vector<std::string> owner_of_signatures) {
  for (const auto& signature : owner_of_signatures) {
    owner_of_selectors_.insert(sigil::oracle::make_selector(signature));
  }
}

bool unique_asset_ledger::mint(const sigil::schema::address_t& to,
                               const sigil::schema::token_id_t& token_id) {
  if (sigil::schema::is_zero(to) || owners_.contains(token_id)) {
    return false;
  }
  owners_.emplace(token_id, to);
  return true;
}

bool unique_asset_ledger::transfer(const sigil::schema::address_t& from,
                                   const sigil::schema::address_t& to,
                                   const sigil::schema::token_id_t& token_id) {
  auto it = owners_.find(token_id);
  if (it == std::end(owners_) || it->second != from ||
      sigil::schema::is_zero(to)) {
    return false;
  }
  it->second = to;
  return true;
}

std::optional<sigil::schema::address_t> unique_asset_ledger::owner_of(
    const sigil::schema::token_id_t& token_id) const {
  auto it = owners_.find(token_id);
  if (it == std::end(owners_)) {
    return std::nullopt;
  }
  return it->second;
}

sigil::oracle::call_result unique_asset_ledger::static_call(
    const sigil::oracle::function_selector_t& selector,
    const sigil::schema::bytes_view_t& arguments) const {
  auto reverted =
      sigil::oracle::call_result{.status = sigil::oracle::call_status::reverted};
  if (!owner_of_selectors_.contains(selector)) {
    return reverted;
  }
  auto token_id = sigil::oracle::decode_token_id_argument(arguments);
  if (!token_id.has_value()) {
    return reverted;
  }
  // Nonexistent tokens revert rather than report the null owner.
  auto owner = owner_of(*token_id);
  if (!owner.has_value()) {
    return reverted;
  }
  return sigil::oracle::call_result{
      .status = sigil::oracle::call_status::success,
      .output = sigil::oracle::encode_address_result(*owner)};
}

}  // namespace sigil::host
