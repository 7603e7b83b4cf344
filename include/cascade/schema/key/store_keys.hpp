#pragma once

#include <cascade/schema/primitives.hpp>
#include <optional>
#include <string_view>

// Schema key type: store keys.
// Error workflow: Key prefixes and key codecs of the catalog, procedure
// directory, configuration and audit key spaces.
namespace cascade::schema::key {

inline constexpr std::string_view kErrorDefinitionPrefix{"ERR|DEF|"};
inline constexpr std::string_view kProcedurePrefix{"ERR|PROC|"};
inline constexpr std::string_view kParameterPrefix{"CFG|PARAM|"};
inline constexpr std::string_view kAuditEntryPrefix{"AUD|ENTRY|"};
inline constexpr std::string_view kAuditSequenceKey{"AUD|SEQ"};

bytes_t make_error_definition_key(std::string_view procedure_name,
                                  std::string_view error_name);
bytes_t make_procedure_key(procedure_id_t procedure_id);
bytes_t make_parameter_key(std::string_view name);
bytes_t make_audit_entry_key(audit_id_t audit_id);

/// Audit id encoded in an `AUD|ENTRY|` key, or std::nullopt for a foreign key.
std::optional<audit_id_t> parse_audit_entry_key(const bytes_view_t& key);

}  // namespace cascade::schema::key
