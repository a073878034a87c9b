#pragma once
#include <sigil/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace sigil::storage {

/// One staged write: a value to put, or std::nullopt to erase the key.
using write_entry_t =
    std::pair<sigil::schema::bytes_t, std::optional<sigil::schema::bytes_t>>;

/// Last committed checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  sigil::schema::hash32_t state_root{};
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const sigil::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const sigil::schema::bytes_view_t& key,
           const T& value);

  /// Raw stored bytes at key, or std::nullopt when missing.
  std::optional<sigil::schema::bytes_t> get_bytes(
      const sigil::schema::bytes_view_t& key) const;

  /// Atomically apply all entries and, when given, the new checkpoint.
  void commit_batch(const std::vector<write_entry_t>& entries,
                    const std::optional<committed_state>& state);

  /// Load the most recent committed checkpoint (height + state_root).
  std::optional<committed_state> load_committed_state() const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace sigil::storage
