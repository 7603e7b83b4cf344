#pragma once

#include <cascade/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: audit entry.
// Error workflow: Invocation window of one frame. end_time is written once,
// either on normal completion or together with error_message on failure.
namespace cascade::schema {

template <uint16_t Version>
struct audit_entry;

template <>
struct audit_entry<1> final {
  uint16_t version{1};
  audit_id_t audit_id{};
  std::string procedure_name;
  std::optional<std::string> input_data;
  std::optional<std::string> output_data;
  std::optional<std::string> error_message;
  timestamp_milliseconds_t start_time{};
  std::optional<timestamp_milliseconds_t> end_time;
};

using audit_entry_t = audit_entry<1>;

}  // namespace cascade::schema
