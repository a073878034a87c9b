#include <sigil/host/registry.hpp>

#include <spdlog/spdlog.h>

#include <utility>

namespace sigil::host {

void registry::deploy(const sigil::schema::address_t& address,
                      std::shared_ptr<const contract> deployed) {
  spdlog::debug("Deploying in-process contract at {}",
                sigil::schema::to_hex(address));
  contracts_[address] = std::move(deployed);
}

bool registry::contains(const sigil::schema::address_t& address) const {
  return contracts_.contains(address);
}

sigil::oracle::call_result registry::static_call(
    const sigil::schema::address_t& contract,
    const sigil::oracle::function_selector_t& selector,
    const sigil::schema::bytes_view_t& arguments) const {
  auto it = contracts_.find(contract);
  if (it == std::end(contracts_) || !it->second) {
    return sigil::oracle::call_result{
        .status = sigil::oracle::call_status::no_contract};
  }
  return it->second->static_call(selector, arguments);
}

}  // namespace sigil::host
