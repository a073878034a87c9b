#include <sigil/common/critical.hpp>
#include <sigil/storage/rocksdb/storage.hpp>

namespace sigil::storage {

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  auto store = storage<rocksdb_storage_tag>();

  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.IncreaseParallelism();
  options.OptimizeLevelStyleCompaction();

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status =
      ROCKSDB_NAMESPACE::DB::Open(options, std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open RocksDB at {}: {}", path, status.ToString());
    sigil::common::critical("Failed to open RocksDB");
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

std::optional<sigil::schema::bytes_t>
storage<rocksdb_storage_tag>::get_bytes(
    const sigil::schema::bytes_view_t& key) const {
  if (!database) {
    sigil::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::nullopt;
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    sigil::common::critical("Failed to get value from RocksDB");
  }
  return sigil::schema::bytes_t{std::begin(value), std::end(value)};
}

void storage<rocksdb_storage_tag>::commit_batch(
    const std::vector<write_entry_t>& entries,
    const std::optional<committed_state>& state) {
  if (!database) {
    sigil::common::critical("RocksDB database is not initialized");
  }

  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& [key, value] : entries) {
    auto key_slice =
        detail::to_slice(sigil::schema::bytes_view_t{key.data(), key.size()});
    auto status =
        value.has_value()
            ? batch.Put(key_slice,
                        detail::to_slice(sigil::schema::bytes_view_t{
                            value->data(), value->size()}))
            : batch.Delete(key_slice);
    if (!status.ok()) {
      sigil::common::critical("failed staging key in write batch");
    }
  }

  if (state.has_value()) {
    auto encoder = detail::encoder_t{};
    auto encoded = encoder.encode(std::tuple{state->height, state->state_root});
    auto status = batch.Put(
        std::string{detail::kCommittedStateKey},
        std::string{reinterpret_cast<const char*>(encoded.data()),
                    encoded.size()});
    if (!status.ok()) {
      sigil::common::critical("failed staging committed state");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    spdlog::error("Failed to commit write batch: {}", write_status.ToString());
    sigil::common::critical("failed to commit write batch");
  }
}

std::optional<committed_state>
storage<rocksdb_storage_tag>::load_committed_state() const {
  if (!database) {
    sigil::common::critical("RocksDB database is not initialized");
  }

  auto committed_raw = std::string{};
  auto committed_status =
      database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                    std::string{detail::kCommittedStateKey}, &committed_raw);
  if (committed_status.IsNotFound()) {
    return std::nullopt;
  }
  if (!committed_status.ok()) {
    sigil::common::critical("failed to load committed state");
  }

  auto encoder = detail::encoder_t{};
  auto decoded =
      encoder.try_decode<std::tuple<int64_t, sigil::schema::hash32_t>>(
          sigil::schema::bytes_view_t{
              reinterpret_cast<const uint8_t*>(committed_raw.data()),
              committed_raw.size()});
  if (!decoded.has_value()) {
    sigil::common::critical("failed to decode committed state");
  }
  return committed_state{.height = std::get<0>(decoded.value()),
                         .state_root = std::get<1>(decoded.value())};
}

}  // namespace sigil::storage
