#include <sigil/oracle/ownership_source.hpp>

#include <spdlog/fmt/fmt.h>

#include <cstdint>
#include <utility>

namespace sigil::oracle {

std::optional<sigil::schema::address_t> ownership_source::owner_of(
    const contract_host& host,
    const sigil::schema::address_t& contract,
    const sigil::schema::token_id_t& token_id,
    std::string& error) const {
  auto arguments = encode_token_id_argument(token_id);
  auto result = host.static_call(
      contract, make_selector(signature()),
      sigil::schema::bytes_view_t{arguments.data(), arguments.size()});
  switch (result.status) {
    case call_status::success:
      break;
    case call_status::reverted:
      error = fmt::format("{} reverted on {}", signature(),
                          sigil::schema::to_hex(contract));
      return std::nullopt;
    case call_status::no_contract:
      error = fmt::format("no contract at {}", sigil::schema::to_hex(contract));
      return std::nullopt;
  }
  if (result.status != call_status::success) {
    error = fmt::format("unknown call status {} from {}",
                        static_cast<uint32_t>(result.status),
                        sigil::schema::to_hex(contract));
    return std::nullopt;
  }

  auto owner = decode_address_result(sigil::schema::bytes_view_t{
      result.output.data(), result.output.size()});
  if (!owner.has_value()) {
    error = fmt::format("{} returned an undecodable payload of {} bytes",
                        signature(), result.output.size());
    return std::nullopt;
  }
  return owner;
}

std::string_view default_ownership_source::signature() const {
  return kDefaultOwnerOfSignature;
}

custom_signature_ownership_source::custom_signature_ownership_source(
    std::string signature)
    : signature_{std::move(signature)} {}

std::string_view custom_signature_ownership_source::signature() const {
  return signature_;
}

}  // namespace sigil::oracle
