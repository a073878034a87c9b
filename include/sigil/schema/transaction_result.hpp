#pragma once

#include <sigil/schema/primitives.hpp>
#include <sigil/schema/transaction_error_code.hpp>
#include <sigil/schema/transaction_event.hpp>
#include <cstdint>
#include <string>
#include <vector>

namespace sigil::schema {

template <uint16_t Version>
struct transaction_result;

template <>
struct transaction_result<1> final {
  uint16_t version{1};
  uint32_t code{};
  bytes_t data;
  std::string log;
  std::string info;
  std::string codespace;
  std::vector<transaction_event_t> events;

  bool ok() const { return code == 0; }
  error_kind kind() const { return error_kind_of(code); }
};

using transaction_result_t = transaction_result<1>;

}  // namespace sigil::schema
