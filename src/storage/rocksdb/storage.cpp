#include <zkaffinity/storage/rocksdb/storage.hpp>

using namespace zkaffinity::common;
using namespace zkaffinity::schema;

namespace zkaffinity::storage {

namespace {

error_t not_open() {
  return make_error(error_code::database_error,
                    "RocksDB database is not initialized");
}

}  // namespace

namespace detail {

result_t<std::optional<bytes_t>> get_value(
    ROCKSDB_NAMESPACE::DB* database,
    const ROCKSDB_NAMESPACE::ReadOptions& options,
    const bytes_view_t& key) {
  if (database == nullptr) {
    return not_open();
  }
  auto value = std::string{};
  auto status = database->Get(options, to_slice(key), &value);
  if (status.IsNotFound()) {
    return std::optional<bytes_t>{};
  }
  if (!status.ok()) {
    spdlog::error("Failed to get value from RocksDB: {}", status.ToString());
    return make_error(error_code::database_error,
                      "Failed to get value from RocksDB");
  }
  return std::optional<bytes_t>{make_bytes(value)};
}

result_t<std::vector<key_value_entry_t>> scan_prefix(
    ROCKSDB_NAMESPACE::DB* database,
    const ROCKSDB_NAMESPACE::ReadOptions& options,
    const bytes_view_t& prefix) {
  if (database == nullptr) {
    return not_open();
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = make_string(prefix);
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(
        key_value_entry_t{to_bytes(iterator->key()), to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    spdlog::error("RocksDB iteration failed: {}",
                  iterator->status().ToString());
    return make_error(error_code::database_error, "RocksDB iteration failed");
  }
  return entries;
}

}  // namespace detail

read_view<rocksdb_storage_tag>::read_view(ROCKSDB_NAMESPACE::DB* db)
    : database{db},
      handle{db != nullptr ? db->GetSnapshot() : nullptr} {}

read_view<rocksdb_storage_tag>::~read_view() {
  if (database != nullptr && handle != nullptr) {
    database->ReleaseSnapshot(handle);
  }
}

ROCKSDB_NAMESPACE::ReadOptions read_view<rocksdb_storage_tag>::options() const {
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  read_options.snapshot = handle;
  return read_options;
}

result_t<std::optional<bytes_t>> read_view<rocksdb_storage_tag>::get(
    const bytes_view_t& key) const {
  return detail::get_value(database, options(), key);
}

result_t<std::vector<key_value_entry_t>>
read_view<rocksdb_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix) const {
  return detail::scan_prefix(database, options(), prefix);
}

result_t<std::optional<bytes_t>> storage<rocksdb_storage_tag>::get(
    const bytes_view_t& key) const {
  return detail::get_value(database.get(), ROCKSDB_NAMESPACE::ReadOptions{},
                           key);
}

result_t<std::vector<key_value_entry_t>>
storage<rocksdb_storage_tag>::list_by_prefix(const bytes_view_t& prefix) const {
  return detail::scan_prefix(database.get(), ROCKSDB_NAMESPACE::ReadOptions{},
                             prefix);
}

status_t storage<rocksdb_storage_tag>::commit(const write_batch& batch) const {
  if (!database) {
    return not_open();
  }
  auto rocks_batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto& key : batch.deletes) {
    auto status = rocks_batch.Delete(detail::to_slice(key));
    if (!status.ok()) {
      spdlog::error("Failed staging delete: {}", status.ToString());
      return make_error(error_code::database_error, "Failed staging delete");
    }
  }
  for (const auto& [key, value] : batch.puts) {
    auto status = rocks_batch.Put(detail::to_slice(key), detail::to_slice(value));
    if (!status.ok()) {
      spdlog::error("Failed staging put: {}", status.ToString());
      return make_error(error_code::database_error, "Failed staging put");
    }
  }

  auto write_options = ROCKSDB_NAMESPACE::WriteOptions{};
  write_options.sync = true;
  auto status = database->Write(write_options, &rocks_batch);
  if (!status.ok()) {
    spdlog::error("Failed to commit RocksDB batch: {}", status.ToString());
    return make_error(error_code::database_error,
                      "Failed to commit RocksDB batch");
  }
  return std::nullopt;
}

read_view<rocksdb_storage_tag> storage<rocksdb_storage_tag>::snapshot() const {
  return read_view<rocksdb_storage_tag>{database.get()};
}

template <>
result_t<storage<rocksdb_storage_tag>> make_storage<rocksdb_storage_tag>(
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
    return make_error(error_code::database_error,
                      "Failed to open RocksDB: " + status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

}  // namespace zkaffinity::storage
