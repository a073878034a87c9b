#include <sigil/blake3/hash.hpp>
#include <sigil/oracle/contract_host.hpp>

#include <algorithm>
#include <iterator>

using namespace sigil::schema;

namespace sigil::oracle {

namespace {

inline constexpr auto kSlotSize = std::size_t{32};
inline constexpr auto kAddressPadding = kSlotSize - sizeof(address_t);

}  // namespace

function_selector_t make_selector(const std::string_view signature) {
  auto digest = sigil::blake3::hash(signature);
  auto selector = function_selector_t{};
  std::copy_n(std::begin(digest), selector.size(), std::begin(selector));
  return selector;
}

bytes_t encode_token_id_argument(const token_id_t& token_id) {
  auto out = bytes_t(kSlotSize, 0);
  auto value = token_id;
  for (auto it = out.rbegin(); it != out.rend(); ++it) {
    *it = static_cast<uint8_t>(value & 0xFF);
    value >>= 8;
  }
  return out;
}

std::optional<token_id_t> decode_token_id_argument(
    const bytes_view_t& arguments) {
  if (arguments.size() != kSlotSize) {
    return std::nullopt;
  }
  auto token_id = token_id_t{0};
  for (const auto byte : arguments) {
    token_id = (token_id << 8) | byte;
  }
  return token_id;
}

bytes_t encode_address_result(const address_t& address) {
  auto out = bytes_t(kAddressPadding, 0);
  out.insert(std::end(out), std::begin(address), std::end(address));
  return out;
}

std::optional<address_t> decode_address_result(const bytes_view_t& output) {
  if (output.size() < kSlotSize) {
    return std::nullopt;
  }
  auto padding = output.first(kAddressPadding);
  if (!std::ranges::all_of(padding, [](const uint8_t b) { return b == 0; })) {
    return std::nullopt;
  }
  auto address = address_t{};
  std::copy_n(output.begin() + kAddressPadding, address.size(),
              std::begin(address));
  return address;
}

}  // namespace sigil::oracle
