#pragma once
#include <sigil/schema/encoding/scale/encoder.hpp>
#include <sigil/storage/overlay.hpp>
#include <sigil/storage/rocksdb/storage.hpp>

namespace sigil::ledger {

using encoder_t =
    sigil::schema::encoding::encoder<sigil::schema::encoding::scale_encoder_tag>;
using storage_t = sigil::storage::storage<sigil::storage::rocksdb_storage_tag>;
using state_t = sigil::storage::state_overlay<storage_t, encoder_t>;

}  // namespace sigil::ledger
