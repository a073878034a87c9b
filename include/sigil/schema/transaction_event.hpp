#pragma once

#include <sigil/schema/transaction_event_attribute.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// Schema type: transaction event.
// Domain event emitted by a committed ledger operation, for observability
// and indexing.
namespace sigil::schema {

inline constexpr auto kMintEventType = std::string_view{"MintTokenBoundToken"};
inline constexpr auto kBindEventType = std::string_view{"BindTokenBoundToken"};
inline constexpr auto kUnbindEventType =
    std::string_view{"UnbindTokenBoundToken"};
inline constexpr auto kPurchaseEventType =
    std::string_view{"PurchaseTokenBoundToken"};

template <uint16_t Version>
struct transaction_event;

template <>
struct transaction_event<1> final {
  uint16_t version{1};
  std::string type;
  std::vector<transaction_event_attribute_t> attributes;

  /// Value of the first attribute named `key`.
  std::optional<std::string> attribute(const std::string_view key) const {
    for (const auto& attribute : attributes) {
      if (attribute.key == key) {
        return attribute.value;
      }
    }
    return std::nullopt;
  }
};

using transaction_event_t = transaction_event<1>;

}  // namespace sigil::schema
