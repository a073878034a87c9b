#pragma once
#include <sigil/oracle/contract_host.hpp>
#include <sigil/schema/primitives.hpp>
#include <optional>
#include <string>
#include <string_view>

namespace sigil::oracle {

inline constexpr auto kDefaultOwnerOfSignature =
    std::string_view{"ownerOf(uint256)"};

/// Capability answering "who owns token X" for one external contract.
class ownership_source {
 public:
  virtual ~ownership_source() = default;

  /// Signature of the owner query this source issues.
  virtual std::string_view signature() const = 0;

  /// Issue the read-only owner query. Returns std::nullopt and sets `error`
  /// when the call fails, reverts, or returns an undecodable payload.
  std::optional<sigil::schema::address_t> owner_of(
      const contract_host& host,
      const sigil::schema::address_t& contract,
      const sigil::schema::token_id_t& token_id,
      std::string& error) const;
};

class default_ownership_source final : public ownership_source {
 public:
  std::string_view signature() const override;
};

class custom_signature_ownership_source final : public ownership_source {
 public:
  explicit custom_signature_ownership_source(std::string signature);

  std::string_view signature() const override;

 private:
  std::string signature_;
};

}  // namespace sigil::oracle
