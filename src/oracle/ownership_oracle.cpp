#include <sigil/oracle/ownership_oracle.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace sigil::oracle {

ownership_oracle::ownership_oracle(const contract_host& host,
                                   owner_of_function_lookup_t lookup)
    : host_{host}, lookup_{std::move(lookup)} {}

std::string ownership_oracle::resolve_function(
    const sigil::schema::address_t& contract) const {
  if (lookup_) {
    if (auto signature = lookup_(contract)) {
      return *signature;
    }
  }
  return std::string{kDefaultOwnerOfSignature};
}

std::unique_ptr<ownership_source> ownership_oracle::resolve_source(
    const sigil::schema::address_t& contract) const {
  if (lookup_) {
    if (auto signature = lookup_(contract)) {
      return std::make_unique<custom_signature_ownership_source>(
          std::move(*signature));
    }
  }
  return std::make_unique<default_ownership_source>();
}

std::optional<bool> ownership_oracle::owns_token(
    const sigil::schema::address_t& contract,
    const sigil::schema::token_id_t& token_id,
    const sigil::schema::address_t& claimed_owner,
    std::string& error) const {
  if (sigil::schema::is_zero(contract)) {
    error = "ownership query against the null address";
    return std::nullopt;
  }

  auto source = resolve_source(contract);
  auto owner = source->owner_of(host_, contract, token_id, error);
  if (!owner.has_value()) {
    spdlog::debug("Ownership resolution failed: {}", error);
    return std::nullopt;
  }
  return *owner == claimed_owner;
}

}  // namespace sigil::oracle
