#pragma once
#include <rocksdb/db.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <sigil/common/critical.hpp>
#include <sigil/schema/encoding/scale/encoder.hpp>
#include <sigil/storage/storage.hpp>
#include <memory>
#include <string_view>
#include <tuple>

namespace sigil::storage {

namespace detail {

using encoder_t =
    sigil::schema::encoding::encoder<sigil::schema::encoding::scale_encoder_tag>;

inline constexpr auto kCommittedStateKey =
    std::string_view{"SYS|APP|COMMITTED_STATE"};

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const sigil::schema::bytes_view_t& bytes) {
  return ROCKSDB_NAMESPACE::Slice{reinterpret_cast<const char*>(bytes.data()),
                                  bytes.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;

  template <typename Encoder, typename T>
  std::optional<T> get(Encoder& encoder,
                       const sigil::schema::bytes_view_t& key) const;

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const sigil::schema::bytes_view_t& key,
           const T& value);

  std::optional<sigil::schema::bytes_t> get_bytes(
      const sigil::schema::bytes_view_t& key) const;
  void commit_batch(const std::vector<write_entry_t>& entries,
                    const std::optional<committed_state>& state);
  std::optional<committed_state> load_committed_state() const;
};

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename Encoder, typename T>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const sigil::schema::bytes_view_t& key) const {
  auto value = get_bytes(key);
  if (!value.has_value()) {
    return std::nullopt;
  }
  return {encoder.template decode<T>(
      sigil::schema::bytes_view_t{value->data(), value->size()})};
}

template <typename Encoder, typename T>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const sigil::schema::bytes_view_t& key,
                                       const T& value) {
  if (!database) {
    sigil::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(sigil::schema::bytes_view_t{encoded_value.data(),
                                                   encoded_value.size()}));
  if (!status.ok()) {
    spdlog::error("Failed to put value into RocksDB: {}", status.ToString());
    sigil::common::critical("Failed to put value into RocksDB");
  }
}

}  // namespace sigil::storage
