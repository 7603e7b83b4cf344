#pragma once
#include <cascade/schema/audit_entry.hpp>
#include <cascade/schema/error_definition.hpp>
#include <cascade/schema/parameter.hpp>
#include <cascade/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cascade::storage {

using key_value_entry_t =
    std::pair<cascade::schema::bytes_t, cascade::schema::bytes_t>;

/// Procedure directory: procedure id -> procedure name.
using procedure_directory_t =
    std::map<cascade::schema::procedure_id_t, std::string>;

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const cascade::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const cascade::schema::bytes_view_t& key,
           const T& value);

  /// Insert one error definition. Throws common::failure 2601 when the
  /// (procedure, error name) pair or the error id is already taken.
  void put_error_definition(
      const cascade::schema::error_definition_t& definition) const;

  /// Atomically replace the whole error catalog.
  void replace_error_definitions(
      const std::vector<cascade::schema::error_definition_t>& definitions)
      const;

  std::vector<cascade::schema::error_definition_t> list_error_definitions()
      const;

  /// Return the id of `procedure_name`, registering it when unknown.
  cascade::schema::procedure_id_t register_procedure(
      std::string_view procedure_name) const;

  procedure_directory_t list_procedures() const;

  std::optional<cascade::schema::parameter_t> get_parameter(
      std::string_view name) const;
  void put_parameter(const cascade::schema::parameter_t& parameter) const;
  std::vector<cascade::schema::parameter_t> list_parameters() const;

  std::optional<cascade::schema::audit_entry_t> get_audit_entry(
      cascade::schema::audit_id_t audit_id) const;

  /// Persist an audit entry. When `sequence` is set the id counter is written
  /// in the same batch.
  void put_audit_entry(
      const cascade::schema::audit_entry_t& entry,
      std::optional<cascade::schema::audit_id_t> sequence = std::nullopt) const;

  /// Audit entries in id order.
  std::vector<cascade::schema::audit_entry_t> list_audit_entries() const;

  void remove_audit_entries(
      const std::vector<cascade::schema::audit_id_t>& audit_ids) const;

  /// Last allocated audit id, or std::nullopt before the first allocation.
  std::optional<cascade::schema::audit_id_t> load_audit_sequence() const;

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const cascade::schema::bytes_view_t& prefix) const;

  /// Atomically replace all entries under prefix with provided entries.
  void replace_by_prefix(const cascade::schema::bytes_view_t& prefix,
                         const std::vector<key_value_entry_t>& entries) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace cascade::storage
