#pragma once

#include <surety/schema/encoding/scale/encoder.hpp>
#include <surety/storage/rocksdb/storage.hpp>

namespace surety::execution {

using encoder_t = surety::schema::encoding::encoder<
    surety::schema::encoding::scale_encoder_tag>;
using storage_t =
    surety::storage::storage<surety::storage::rocksdb_storage_tag>;

}  // namespace surety::execution
