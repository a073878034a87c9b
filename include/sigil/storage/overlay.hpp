#pragma once
#include <sigil/schema/primitives.hpp>
#include <sigil/storage/storage.hpp>
#include <iterator>
#include <map>
#include <optional>
#include <vector>

namespace sigil::storage {

/// Write set staged on top of a storage backend.
///
/// Reads see staged writes first. Nothing reaches the backend until the
/// owner hands `entries()` to `commit_batch`; dropping the overlay discards
/// every staged write.
template <typename Storage, typename Encoder>
class state_overlay final {
 public:
  state_overlay(Storage& storage, Encoder& encoder)
      : storage_{storage}, encoder_{encoder} {}

  template <typename T>
  std::optional<T> get(const sigil::schema::bytes_t& key) const {
    auto staged = writes_.find(key);
    if (staged != std::end(writes_)) {
      if (!staged->second.has_value()) {
        return std::nullopt;
      }
      return encoder_.template decode<T>(sigil::schema::bytes_view_t{
          staged->second->data(), staged->second->size()});
    }
    auto stored = storage_.get_bytes(
        sigil::schema::bytes_view_t{key.data(), key.size()});
    if (!stored.has_value()) {
      return std::nullopt;
    }
    return encoder_.template decode<T>(
        sigil::schema::bytes_view_t{stored->data(), stored->size()});
  }

  template <typename T>
  void put(const sigil::schema::bytes_t& key, const T& value) {
    writes_[key] = encoder_.encode(value);
  }

  void erase(const sigil::schema::bytes_t& key) { writes_[key] = std::nullopt; }

  bool empty() const { return writes_.empty(); }

  std::vector<write_entry_t> entries() const {
    return std::vector<write_entry_t>{std::begin(writes_), std::end(writes_)};
  }

  Encoder& encoder() const { return encoder_; }

 private:
  Storage& storage_;
  Encoder& encoder_;
  std::map<sigil::schema::bytes_t, std::optional<sigil::schema::bytes_t>>
      writes_;
};

}  // namespace sigil::storage
