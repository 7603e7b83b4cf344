#pragma once

#include <cascade/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: error definition.
// Error workflow: Catalog row: message templates of one error owned by one
// procedure. Unique on (procedure_name, error_name) and on error_id.
namespace cascade::schema {

template <uint16_t Version>
struct error_definition;

template <>
struct error_definition<1> final {
  uint16_t version{1};
  error_code_t error_id{};
  std::string procedure_name;
  std::string error_name;
  std::string user_message;
  std::optional<std::string> developer_message;
};

using error_definition_t = error_definition<1>;

}  // namespace cascade::schema
