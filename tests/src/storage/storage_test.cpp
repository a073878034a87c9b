#include <gtest/gtest.h>
#include <sigil/schema/encoding/scale/encoder.hpp>
#include <sigil/storage/rocksdb/storage.hpp>
#include <sigil/storage/storage.hpp>
#include <sigil/testing/common.hpp>

#include <optional>
#include <string>
#include <vector>

namespace {

using storage_t = sigil::storage::storage<sigil::storage::rocksdb_storage_tag>;
using encoder_t =
    sigil::schema::encoding::encoder<sigil::schema::encoding::scale_encoder_tag>;

sigil::schema::bytes_view_t view(const sigil::schema::bytes_t& bytes) {
  return sigil::schema::bytes_view_t{bytes.data(), bytes.size()};
}

}  // namespace

TEST(storage, defaults_are_stable) {
  auto committed = sigil::storage::committed_state{};
  EXPECT_EQ(committed.height, 0);
  EXPECT_EQ(committed.state_root, sigil::schema::make_zero_hash());
}

TEST(storage, typed_put_and_get_round_trip) {
  auto db = sigil::testing::make_db_path("sigil_storage_typed");
  {
    auto storage =
        sigil::storage::make_storage<sigil::storage::rocksdb_storage_tag>(db);
    auto encoder = encoder_t{};
    auto key = sigil::schema::make_bytes(std::string_view{"key"});
    storage.put(encoder, view(key), std::string{"value"});

    auto loaded = storage.get<encoder_t, std::string>(encoder, view(key));
    ASSERT_TRUE(loaded.has_value());
    EXPECT_EQ(*loaded, "value");

    auto missing = sigil::schema::make_bytes(std::string_view{"missing"});
    EXPECT_FALSE(storage.get_bytes(view(missing)).has_value());
  }
  sigil::testing::remove_path(db);
}

TEST(storage, commit_batch_applies_puts_erases_and_checkpoint) {
  auto db = sigil::testing::make_db_path("sigil_storage_batch");
  {
    auto storage =
        sigil::storage::make_storage<sigil::storage::rocksdb_storage_tag>(db);
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto a = sigil::schema::make_bytes(std::string_view{"a"});
    auto b = sigil::schema::make_bytes(std::string_view{"b"});
    storage.commit_batch({{a, sigil::schema::bytes_t{0x01}},
                          {b, sigil::schema::bytes_t{0x02}}},
                         std::nullopt);
    EXPECT_FALSE(storage.load_committed_state().has_value());

    auto root = sigil::testing::make_hash(7);
    storage.commit_batch({{a, std::nullopt}},
                         sigil::storage::committed_state{.height = 3,
                                                         .state_root = root});
    EXPECT_FALSE(storage.get_bytes(view(a)).has_value());
    EXPECT_EQ(storage.get_bytes(view(b)), sigil::schema::bytes_t{0x02});

    auto committed = storage.load_committed_state();
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed->height, 3);
    EXPECT_EQ(committed->state_root, root);
  }
  sigil::testing::remove_path(db);
}

TEST(storage, data_survives_reopen) {
  auto db = sigil::testing::make_db_path("sigil_storage_reopen");
  auto key = sigil::schema::make_bytes(std::string_view{"persisted"});
  {
    auto storage =
        sigil::storage::make_storage<sigil::storage::rocksdb_storage_tag>(db);
    storage.commit_batch({{key, sigil::schema::bytes_t{0xAA, 0xBB}}},
                         sigil::storage::committed_state{
                             .height = 1,
                             .state_root = sigil::testing::make_hash(1)});
  }
  {
    auto storage =
        sigil::storage::make_storage<sigil::storage::rocksdb_storage_tag>(db);
    EXPECT_EQ(storage.get_bytes(view(key)),
              (sigil::schema::bytes_t{0xAA, 0xBB}));
    ASSERT_TRUE(storage.load_committed_state().has_value());
    EXPECT_EQ(storage.load_committed_state()->height, 1);
  }
  sigil::testing::remove_path(db);
}
