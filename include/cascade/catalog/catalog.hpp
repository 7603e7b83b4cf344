#pragma once

#include <cascade/schema/error_definition.hpp>
#include <cascade/schema/primitives.hpp>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace cascade::catalog {

/// Owner of the fallback entries and name of the dispatching handler.
inline constexpr auto kFallbackProcedure = std::string_view{"ErrorHandler"};
inline constexpr auto kUnknownError = std::string_view{"UnknownError"};
inline constexpr auto kUnknownSystemError =
    std::string_view{"UnknownSystemError"};
inline constexpr auto kIndexViolation = std::string_view{"IndexViolation"};
inline constexpr auto kDeadlock = std::string_view{"Deadlock"};

/// Template used when not even the fallback entry is available.
inline constexpr auto kBuiltinErrorId = schema::error_code_t{0};
inline constexpr auto kBuiltinUserMessage = std::string_view{
    "Unknown error message \"#ErrorName#\" for procedure \"#ProcedureName#\" "
    "is not defined in the error table. #ChildMessage#"};

/// Read-only snapshot of the error catalog and of the procedure directory
/// that maps procedure ids to names.
///
/// A snapshot never changes after construction; refreshing means loading a
/// new one from storage (see load_catalog()).
class catalog final {
 public:
  catalog() = default;
  explicit catalog(std::vector<schema::error_definition_t> definitions,
                   std::map<schema::procedure_id_t, std::string> procedures =
                       {});

  /// Exact (procedure, error name) match, or nullptr.
  const schema::error_definition_t* find(std::string_view procedure_name,
                                         std::string_view error_name) const;
  /// Match by error id, or nullptr.
  const schema::error_definition_t* find(schema::error_code_t error_id) const;

  std::optional<std::string> procedure_name(schema::procedure_id_t id) const;
  std::optional<schema::procedure_id_t> procedure_id(
      std::string_view name) const;

  const std::vector<schema::error_definition_t>& definitions() const {
    return definitions_;
  }
  const std::map<schema::procedure_id_t, std::string>& procedures() const {
    return procedures_;
  }

 private:
  std::vector<schema::error_definition_t> definitions_;
  std::map<std::pair<std::string, std::string>, std::size_t> by_name_;
  std::map<schema::error_code_t, std::size_t> by_id_;
  std::map<schema::procedure_id_t, std::string> procedures_;
};

}  // namespace cascade::catalog
