#include <cascade/schema/key/builder.hpp>
#include <cascade/schema/key/store_keys.hpp>

#include <boost/endian/conversion.hpp>
#include <cstring>

using namespace cascade::schema;

namespace cascade::schema::key {

bytes_t make_error_definition_key(const std::string_view procedure_name,
                                  const std::string_view error_name) {
  auto b = builder{};
  b.write(kErrorDefinitionPrefix);
  b.field(procedure_name);
  b.field(error_name);
  return b.data;
}

bytes_t make_procedure_key(const procedure_id_t procedure_id) {
  auto b = builder{};
  b.write(kProcedurePrefix);
  b.write(procedure_id);
  return b.data;
}

bytes_t make_parameter_key(const std::string_view name) {
  auto b = builder{};
  b.write(kParameterPrefix);
  b.write(name);
  return b.data;
}

bytes_t make_audit_entry_key(const audit_id_t audit_id) {
  auto b = builder{};
  b.write(kAuditEntryPrefix);
  b.write(audit_id);
  return b.data;
}

std::optional<audit_id_t> parse_audit_entry_key(const bytes_view_t& key) {
  auto text = make_string_view(key);
  if (!text.starts_with(kAuditEntryPrefix) ||
      text.size() != kAuditEntryPrefix.size() + sizeof(audit_id_t)) {
    return std::nullopt;
  }
  auto big = audit_id_t{};
  std::memcpy(&big, key.data() + kAuditEntryPrefix.size(), sizeof(big));
  return boost::endian::big_to_native(big);
}

}  // namespace cascade::schema::key
