#pragma once
#include <sigil/common/critical.hpp>
#include <sigil/schema/encoding/encoder.hpp>
#include <sigil/schema/encoding/scale/bind.hpp>
#include <sigil/schema/encoding/scale/binding_state.hpp>
#include <sigil/schema/encoding/scale/mint.hpp>
#include <sigil/schema/encoding/scale/mint_batch.hpp>
#include <sigil/schema/encoding/scale/purchase.hpp>
#include <sigil/schema/encoding/scale/purchase_and_bind.hpp>
#include <sigil/schema/encoding/scale/set_owner_of_function.hpp>
#include <sigil/schema/encoding/scale/set_payee.hpp>
#include <sigil/schema/encoding/scale/transaction.hpp>
#include <sigil/schema/encoding/scale/transaction_event.hpp>
#include <sigil/schema/encoding/scale/transaction_event_attribute.hpp>
#include <sigil/schema/encoding/scale/unbind.hpp>
#include <iterator>
#include <scale/scale.hpp>

namespace sigil::schema::encoding {

struct scale_encoder_tag {};

template <>
struct encoder<scale_encoder_tag> final {
  template <typename T>
  sigil::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sigil::schema::bytes_t& out);

  template <typename T>
  T decode(const sigil::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sigil::schema::bytes_view_t& bytes);
};

template <typename T>
sigil::schema::bytes_t encoder<scale_encoder_tag>::encode(const T& obj) {
  auto encoded = ::scale::impl::memory::encode(obj);
  if (!encoded) {
    sigil::common::critical("failed to encode SCALE object");
  }
  return encoded.value();
}

template <typename T>
void encoder<scale_encoder_tag>::encode(const T& obj,
                                        sigil::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<scale_encoder_tag>::decode(const sigil::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    sigil::common::critical("failed to decode SCALE bytes");
  }
  return decoded.value();
}

template <typename T>
std::optional<T> encoder<scale_encoder_tag>::try_decode(
    const sigil::schema::bytes_view_t& bytes) {
  auto decoded = ::scale::impl::memory::decode<T>(bytes);
  if (!decoded) {
    return std::nullopt;
  }
  return decoded.value();
}

}  // namespace sigil::schema::encoding
