#pragma once
#include <sigil/oracle/contract_host.hpp>
#include <sigil/schema/primitives.hpp>
#include <map>
#include <memory>

namespace sigil::host {

/// An in-process contract reachable through the registry.
class contract {
 public:
  virtual ~contract() = default;

  virtual sigil::oracle::call_result static_call(
      const sigil::oracle::function_selector_t& selector,
      const sigil::schema::bytes_view_t& arguments) const = 0;
};

/// In-process contract host: dispatches read-only calls by address.
class registry final : public sigil::oracle::contract_host {
 public:
  /// Install (or replace) the contract answering at `address`.
  void deploy(const sigil::schema::address_t& address,
              std::shared_ptr<const contract> deployed);

  bool contains(const sigil::schema::address_t& address) const;

  sigil::oracle::call_result static_call(
      const sigil::schema::address_t& contract,
      const sigil::oracle::function_selector_t& selector,
      const sigil::schema::bytes_view_t& arguments) const override;

 private:
  std::map<sigil::schema::address_t, std::shared_ptr<const contract>>
      contracts_;
};

}  // namespace sigil::host
