#pragma once
#include <rocksdb/db.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/write_batch.h>
#include <spdlog/spdlog.h>
#include <cascade/common/critical.hpp>
#include <cascade/schema/encoding/scale/encoder.hpp>
#include <cascade/storage/storage.hpp>
#include <memory>
#include <mutex>
#include <scale/scale.hpp>
#include <string_view>

namespace cascade::storage {

namespace detail {

using encoder_t = cascade::schema::encoding::encoder<
    cascade::schema::encoding::scale_encoder_tag>;

inline ROCKSDB_NAMESPACE::Slice to_slice(
    const cascade::schema::bytes_view_t& bytes) {
  return {reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

inline cascade::schema::bytes_t to_bytes(
    const ROCKSDB_NAMESPACE::Slice& slice) {
  return {reinterpret_cast<const uint8_t*>(slice.data()),
          reinterpret_cast<const uint8_t*>(slice.data()) + slice.size()};
}

}  // namespace detail

struct rocksdb_storage_tag {};

template <>
struct storage<rocksdb_storage_tag> final {
  std::unique_ptr<ROCKSDB_NAMESPACE::DB> database;
  /// Serializes audit id allocation and entry updates across every user of
  /// this store.
  std::unique_ptr<std::mutex> audit_mutex{std::make_unique<std::mutex>()};

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cascade::schema::bytes_view_t& key) const;

  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cascade::schema::bytes_view_t& key,
           const T& value) const;

  void put_error_definition(
      const cascade::schema::error_definition_t& definition) const;
  void replace_error_definitions(
      const std::vector<cascade::schema::error_definition_t>& definitions)
      const;
  std::vector<cascade::schema::error_definition_t> list_error_definitions()
      const;

  cascade::schema::procedure_id_t register_procedure(
      std::string_view procedure_name) const;
  procedure_directory_t list_procedures() const;

  std::optional<cascade::schema::parameter_t> get_parameter(
      std::string_view name) const;
  void put_parameter(const cascade::schema::parameter_t& parameter) const;
  std::vector<cascade::schema::parameter_t> list_parameters() const;

  std::optional<cascade::schema::audit_entry_t> get_audit_entry(
      cascade::schema::audit_id_t audit_id) const;
  void put_audit_entry(
      const cascade::schema::audit_entry_t& entry,
      std::optional<cascade::schema::audit_id_t> sequence = std::nullopt) const;
  std::vector<cascade::schema::audit_entry_t> list_audit_entries() const;
  void remove_audit_entries(
      const std::vector<cascade::schema::audit_id_t>& audit_ids) const;
  std::optional<cascade::schema::audit_id_t> load_audit_sequence() const;
  /// Assign the next id of the audit sequence to `entry` and persist both.
  /// The caller holds `audit_mutex`.
  cascade::schema::audit_id_t append_audit_entry(
      cascade::schema::audit_entry_t& entry) const;

  std::vector<key_value_entry_t> list_by_prefix(
      const cascade::schema::bytes_view_t& prefix) const;
  void replace_by_prefix(const cascade::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

using storage_t = storage<rocksdb_storage_tag>;

template <>
storage<rocksdb_storage_tag> make_storage<rocksdb_storage_tag>(
    const std::string_view& path);

template <typename T, typename Encoder>
std::optional<T> storage<rocksdb_storage_tag>::get(
    Encoder& encoder,
    const cascade::schema::bytes_view_t& key) const {
  if (!database) {
    cascade::common::critical("RocksDB database is not initialized");
  }
  auto value = std::string{};
  auto status = database->Get(ROCKSDB_NAMESPACE::ReadOptions{},
                              detail::to_slice(key), &value);
  if (!status.ok()) {
    if (status.IsNotFound()) {
      return std::nullopt;
    } else {
      cascade::common::critical("Failed to get value from RocksDB",
                                status.ToString());
    }
  }
  return {encoder.template decode<T>(cascade::schema::bytes_view_t{
      reinterpret_cast<const uint8_t*>(value.data()), value.size()})};
}

template <typename T, typename Encoder>
void storage<rocksdb_storage_tag>::put(Encoder& encoder,
                                       const cascade::schema::bytes_view_t& key,
                                       const T& value) const {
  if (!database) {
    cascade::common::critical("RocksDB database is not initialized");
  }
  auto encoded_value = encoder.encode(value);
  auto status = database->Put(
      ROCKSDB_NAMESPACE::WriteOptions{}, detail::to_slice(key),
      detail::to_slice(cascade::schema::bytes_view_t{encoded_value}));
  if (!status.ok()) {
    cascade::common::critical("Failed to put value into RocksDB",
                              status.ToString());
  }
}

}  // namespace cascade::storage
