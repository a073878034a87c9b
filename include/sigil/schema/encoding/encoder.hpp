#pragma once
#include <sigil/schema/primitives.hpp>
#include <optional>
#include <span>

namespace sigil::schema::encoding {

// Encoders are selected at build time by tag; each library specializes this
// template (see scale/encoder.hpp).
template <typename Library>
struct encoder {
  template <typename T>
  sigil::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, sigil::schema::bytes_t& out);

  template <typename T>
  T decode(const sigil::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const sigil::schema::bytes_view_t& bytes);
};

}  // namespace sigil::schema::encoding
