#include <cascade/common/critical.hpp>
#include <cascade/common/failure.hpp>
#include <cascade/schema/key/store_keys.hpp>
#include <cascade/storage/rocksdb/storage.hpp>

#include <boost/endian/conversion.hpp>
#include <spdlog/fmt/fmt.h>
#include <algorithm>
#include <cstring>

using namespace cascade::schema;

namespace cascade::storage {

namespace {

bytes_view_t prefix_view(const std::string_view prefix) {
  return make_bytes_view(prefix);
}

std::optional<procedure_id_t> parse_procedure_key(const bytes_view_t& key) {
  auto text = make_string_view(key);
  if (!text.starts_with(key::kProcedurePrefix) ||
      text.size() != key::kProcedurePrefix.size() + sizeof(procedure_id_t)) {
    return std::nullopt;
  }
  auto big = procedure_id_t{};
  std::memcpy(&big, key.data() + key::kProcedurePrefix.size(), sizeof(big));
  return boost::endian::big_to_native(big);
}

[[noreturn]] void throw_duplicate(const std::string_view index,
                                  const std::string_view value) {
  throw cascade::common::failure{failure_state{
      .number = cascade::common::kUniqueIndexViolation,
      .message = fmt::format(
          "Cannot insert duplicate key row with unique index '{}'. The "
          "duplicate key value is ({}).",
          index, value)}};
}

void check_unique(const std::vector<error_definition_t>& definitions) {
  for (auto it = std::begin(definitions); it != std::end(definitions); ++it) {
    for (auto other = std::next(it); other != std::end(definitions); ++other) {
      if (it->procedure_name == other->procedure_name &&
          it->error_name == other->error_name) {
        throw_duplicate("procedure_error_name",
                        fmt::format("{}, {}", it->procedure_name,
                                    it->error_name));
      }
      if (it->error_id == other->error_id) {
        throw_duplicate("error_id", std::to_string(it->error_id));
      }
    }
  }
}

}  // namespace

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
    cascade::common::critical(fmt::format("Failed to open RocksDB at {}", path),
                              status.ToString());
  }
  spdlog::info("Successfully opened RocksDB at {}", path);
  store.database.reset(database);

  return store;
}

void storage<rocksdb_storage_tag>::put_error_definition(
    const error_definition_t& definition) const {
  auto existing = list_error_definitions();
  existing.push_back(definition);
  check_unique(existing);

  auto encoder = detail::encoder_t{};
  auto key = key::make_error_definition_key(definition.procedure_name,
                                            definition.error_name);
  put(encoder, key, definition);
  spdlog::debug("Stored error definition {} {}/{}", definition.error_id,
                definition.procedure_name, definition.error_name);
}

void storage<rocksdb_storage_tag>::replace_error_definitions(
    const std::vector<error_definition_t>& definitions) const {
  check_unique(definitions);

  auto encoder = detail::encoder_t{};
  auto entries = std::vector<key_value_entry_t>{};
  entries.reserve(definitions.size());
  for (const auto& definition : definitions) {
    entries.emplace_back(key::make_error_definition_key(
                             definition.procedure_name, definition.error_name),
                         encoder.encode(definition));
  }
  replace_by_prefix(prefix_view(key::kErrorDefinitionPrefix), entries);
  spdlog::info("Replaced error catalog with {} definition(s)",
               definitions.size());
}

std::vector<error_definition_t>
storage<rocksdb_storage_tag>::list_error_definitions() const {
  auto definitions = std::vector<error_definition_t>{};
  auto encoder = detail::encoder_t{};
  for (const auto& [key, value] :
       list_by_prefix(prefix_view(key::kErrorDefinitionPrefix))) {
    auto decoded =
        encoder.try_decode<error_definition_t>(make_bytes_view(value));
    if (!decoded) {
      spdlog::warn("Failed decoding error definition for key '{}'",
                   make_string(key));
      continue;
    }
    definitions.push_back(std::move(*decoded));
  }
  return definitions;
}

procedure_id_t storage<rocksdb_storage_tag>::register_procedure(
    const std::string_view procedure_name) const {
  auto procedures = list_procedures();
  auto next = procedure_id_t{1};
  for (const auto& [id, name] : procedures) {
    if (name == procedure_name) {
      return id;
    }
    next = std::max(next, id + 1);
  }
  auto encoder = detail::encoder_t{};
  put(encoder, key::make_procedure_key(next), std::string{procedure_name});
  spdlog::debug("Registered procedure {} as #{}", procedure_name, next);
  return next;
}

procedure_directory_t storage<rocksdb_storage_tag>::list_procedures() const {
  auto procedures = procedure_directory_t{};
  auto encoder = detail::encoder_t{};
  for (const auto& [key, value] :
       list_by_prefix(prefix_view(key::kProcedurePrefix))) {
    auto id = parse_procedure_key(make_bytes_view(key));
    auto name = encoder.try_decode<std::string>(make_bytes_view(value));
    if (!id || !name) {
      spdlog::warn("Failed decoding procedure directory entry");
      continue;
    }
    procedures.emplace(*id, std::move(*name));
  }
  return procedures;
}

std::optional<parameter_t> storage<rocksdb_storage_tag>::get_parameter(
    const std::string_view name) const {
  auto encoder = detail::encoder_t{};
  return get<parameter_t>(encoder, key::make_parameter_key(name));
}

void storage<rocksdb_storage_tag>::put_parameter(
    const parameter_t& parameter) const {
  auto encoder = detail::encoder_t{};
  put(encoder, key::make_parameter_key(parameter.name), parameter);
}

std::vector<parameter_t> storage<rocksdb_storage_tag>::list_parameters()
    const {
  auto parameters = std::vector<parameter_t>{};
  auto encoder = detail::encoder_t{};
  for (const auto& [key, value] :
       list_by_prefix(prefix_view(key::kParameterPrefix))) {
    auto decoded = encoder.try_decode<parameter_t>(make_bytes_view(value));
    if (!decoded) {
      spdlog::warn("Failed decoding parameter for key '{}'", make_string(key));
      continue;
    }
    parameters.push_back(std::move(*decoded));
  }
  return parameters;
}

std::optional<audit_entry_t> storage<rocksdb_storage_tag>::get_audit_entry(
    const audit_id_t audit_id) const {
  auto encoder = detail::encoder_t{};
  return get<audit_entry_t>(encoder, key::make_audit_entry_key(audit_id));
}

void storage<rocksdb_storage_tag>::put_audit_entry(
    const audit_entry_t& entry,
    const std::optional<audit_id_t> sequence) const {
  if (!database) {
    cascade::common::critical("RocksDB database is not initialized");
  }
  auto encoder = detail::encoder_t{};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  auto entry_key = key::make_audit_entry_key(entry.audit_id);
  auto entry_value = encoder.encode(entry);
  auto put_status = batch.Put(detail::to_slice(make_bytes_view(entry_key)),
                              detail::to_slice(make_bytes_view(entry_value)));
  if (!put_status.ok()) {
    cascade::common::critical("failed writing audit entry into batch");
  }
  if (sequence) {
    auto sequence_value = encoder.encode(*sequence);
    auto sequence_status =
        batch.Put(std::string{key::kAuditSequenceKey},
                  detail::to_slice(make_bytes_view(sequence_value)));
    if (!sequence_status.ok()) {
      cascade::common::critical("failed writing audit sequence into batch");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    cascade::common::critical(
        fmt::format("failed to persist audit entry {}", entry.audit_id),
        write_status.ToString());
  }
}

std::vector<audit_entry_t>
storage<rocksdb_storage_tag>::list_audit_entries() const {
  auto entries = std::vector<audit_entry_t>{};
  auto encoder = detail::encoder_t{};
  for (const auto& [key, value] :
       list_by_prefix(prefix_view(key::kAuditEntryPrefix))) {
    auto decoded = encoder.try_decode<audit_entry_t>(make_bytes_view(value));
    if (!decoded) {
      spdlog::warn("Failed decoding audit entry {}",
                   key::parse_audit_entry_key(make_bytes_view(key))
                       .value_or(audit_id_t{}));
      continue;
    }
    entries.push_back(std::move(*decoded));
  }
  return entries;
}

void storage<rocksdb_storage_tag>::remove_audit_entries(
    const std::vector<audit_id_t>& audit_ids) const {
  if (!database) {
    cascade::common::critical("RocksDB database is not initialized");
  }
  if (audit_ids.empty()) {
    return;
  }
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};
  for (const auto audit_id : audit_ids) {
    auto entry_key = key::make_audit_entry_key(audit_id);
    auto delete_status = batch.Delete(detail::to_slice(make_bytes_view(entry_key)));
    if (!delete_status.ok()) {
      cascade::common::critical("failed deleting audit entry in batch");
    }
  }
  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    cascade::common::critical("failed to remove audit entries",
                              write_status.ToString());
  }
}

std::optional<audit_id_t> storage<rocksdb_storage_tag>::load_audit_sequence()
    const {
  auto encoder = detail::encoder_t{};
  return get<audit_id_t>(encoder, make_bytes_view(key::kAuditSequenceKey));
}

audit_id_t storage<rocksdb_storage_tag>::append_audit_entry(
    audit_entry_t& entry) const {
  entry.audit_id = load_audit_sequence().value_or(0) + 1;
  put_audit_entry(entry, entry.audit_id);
  return entry.audit_id;
}

std::vector<key_value_entry_t> storage<rocksdb_storage_tag>::list_by_prefix(
    const bytes_view_t& prefix) const {
  if (!database) {
    cascade::common::critical("RocksDB database is not initialized");
  }

  auto entries = std::vector<key_value_entry_t>{};
  auto prefix_string = make_string(prefix);

  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    entries.push_back(key_value_entry_t{detail::to_bytes(iterator->key()),
                                        detail::to_bytes(iterator->value())});
    iterator->Next();
  }
  if (!iterator->status().ok()) {
    cascade::common::critical("failed to iterate RocksDB prefix",
                              iterator->status().ToString());
  }
  return entries;
}

void storage<rocksdb_storage_tag>::replace_by_prefix(
    const bytes_view_t& prefix,
    const std::vector<key_value_entry_t>& entries) const {
  if (!database) {
    cascade::common::critical("RocksDB database is not initialized");
  }

  auto prefix_string = make_string(prefix);
  auto read_options = ROCKSDB_NAMESPACE::ReadOptions{};
  auto iterator = std::unique_ptr<ROCKSDB_NAMESPACE::Iterator>{
      database->NewIterator(read_options)};
  auto batch = ROCKSDB_NAMESPACE::WriteBatch{};

  iterator->Seek(prefix_string);
  while (iterator->Valid()) {
    auto key_view =
        std::string_view{iterator->key().data(), iterator->key().size()};
    if (!key_view.starts_with(prefix_string)) {
      break;
    }
    auto delete_status = batch.Delete(iterator->key());
    if (!delete_status.ok()) {
      cascade::common::critical(
          "failed deleting key during prefix replacement");
    }
    iterator->Next();
  }

  for (const auto& [key, value] : entries) {
    auto put_status = batch.Put(detail::to_slice(make_bytes_view(key)),
                                detail::to_slice(make_bytes_view(value)));
    if (!put_status.ok()) {
      cascade::common::critical("failed writing key during prefix replacement");
    }
  }

  auto write_status =
      database->Write(ROCKSDB_NAMESPACE::WriteOptions{}, &batch);
  if (!write_status.ok()) {
    cascade::common::critical("failed to commit prefix replacement",
                              write_status.ToString());
  }
}

}  // namespace cascade::storage
