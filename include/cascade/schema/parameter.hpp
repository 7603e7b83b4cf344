#pragma once

#include <cstdint>
#include <optional>
#include <string>

// Schema type: parameter.
// Error workflow: Runtime configuration row (audit toggles, debug mode, purge
// period). Values are free text.
namespace cascade::schema {

template <uint16_t Version>
struct parameter;

template <>
struct parameter<1> final {
  uint16_t version{1};
  std::string name;
  std::optional<std::string> value;
  std::optional<std::string> description;
};

using parameter_t = parameter<1>;

}  // namespace cascade::schema
