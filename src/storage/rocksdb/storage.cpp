#include <surety/common/critical.hpp>
#include <surety/storage/rocksdb/storage.hpp>

#include <filesystem>
#include <system_error>

namespace surety::storage {

namespace {

// One registry process owns the store, and every record is small.
ROCKSDB_NAMESPACE::Options make_registry_options() {
  auto options = ROCKSDB_NAMESPACE::Options{};
  options.create_if_missing = true;
  options.paranoid_checks = true;
  options.OptimizeForSmallDb();
  options.max_open_files = 64;
  options.keep_log_file_num = 4;
  return options;
}

}  // namespace

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path) {
  if (path.empty()) {
    surety::common::critical("Registry store path is empty");
  }

  auto parent = std::filesystem::path{path}.parent_path();
  if (!parent.empty()) {
    auto error = std::error_code{};
    std::filesystem::create_directories(parent, error);
    if (error) {
      spdlog::error("Failed to create {}: {}", parent.string(),
                    error.message());
      surety::common::critical("Failed to create registry store directory");
    }
  }

  ROCKSDB_NAMESPACE::DB* database{nullptr};
  auto status = ROCKSDB_NAMESPACE::DB::Open(make_registry_options(),
                                            std::string{path}, &database);
  if (!status.ok()) {
    spdlog::error("Failed to open registry store at {}: {}", path,
                  status.ToString());
    surety::common::critical("Failed to open RocksDB");
  }

  auto store = storage<rocksdb_storage_tag>();
  store.database.reset(database);

  auto keys = uint64_t{};
  if (store.database->GetIntProperty("rocksdb.estimate-num-keys", &keys)) {
    spdlog::info("Opened registry store at {} (~{} records)", path, keys);
  } else {
    spdlog::info("Opened registry store at {}", path);
  }
  return store;
}

}  // namespace surety::storage
