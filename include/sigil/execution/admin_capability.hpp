#pragma once

#include <sigil/schema/primitives.hpp>

namespace sigil::execution {

class engine;

/// Proof that the bearer passed the administrator check of one engine.
/// Only `engine::authorize_admin` can produce one.
class admin_capability final {
 public:
  const sigil::schema::address_t& administrator() const {
    return administrator_;
  }

 private:
  friend class engine;

  explicit admin_capability(const sigil::schema::address_t& administrator)
      : administrator_{administrator} {}

  sigil::schema::address_t administrator_;
};

}  // namespace sigil::execution
