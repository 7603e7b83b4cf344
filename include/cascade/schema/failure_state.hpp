#pragma once

#include <cascade/schema/primitives.hpp>
#include <cstdint>
#include <optional>
#include <string>

// Schema type: failure state.
// Error workflow: Diagnostic values of a caught failure (number, message,
// raising procedure and line, severity, state), live or captured.
namespace cascade::schema {

inline constexpr auto kDefaultSeverity = int32_t{16};
inline constexpr auto kDefaultState = int32_t{1};

struct failure_state final {
  error_code_t number{};
  std::string message;
  std::string procedure;
  std::optional<int32_t> line;
  int32_t severity{kDefaultSeverity};
  int32_t state{kDefaultState};
};

}  // namespace cascade::schema
