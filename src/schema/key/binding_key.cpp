#include <sigil/common/critical.hpp>
#include <sigil/schema/key/binding_key.hpp>

using namespace sigil::schema;

namespace sigil::schema::key {

std::optional<binding_key_t> try_encode_binding_key(
    const address_t& contract,
    const achievement_id_t& achievement_id) {
  if (achievement_id > max_achievement_id()) {
    return std::nullopt;
  }
  auto key = binding_key_t{0};
  for (const auto byte : contract) {
    key = (key << 8) | byte;
  }
  key <<= kAchievementIdBits;
  key |= binding_key_t{achievement_id};
  return key;
}

binding_key_t encode_binding_key(const address_t& contract,
                                 const achievement_id_t& achievement_id) {
  auto key = try_encode_binding_key(contract, achievement_id);
  if (!key.has_value()) {
    sigil::common::critical("achievement id exceeds 96 bits");
  }
  return *key;
}

std::pair<address_t, achievement_id_t> decode_binding_key(
    const binding_key_t& key) {
  auto achievement_id = static_cast<achievement_id_t>(
      key & binding_key_t{max_achievement_id()});
  auto high = binding_key_t{key >> kAchievementIdBits};
  auto contract = address_t{};
  for (auto it = contract.rbegin(); it != contract.rend(); ++it) {
    *it = static_cast<uint8_t>(high & 0xFF);
    high >>= 8;
  }
  return {contract, achievement_id};
}

}  // namespace sigil::schema::key
