#include <cascade/catalog/catalog.hpp>

#include <spdlog/spdlog.h>

namespace cascade::catalog {

catalog::catalog(std::vector<schema::error_definition_t> definitions,
                 std::map<schema::procedure_id_t, std::string> procedures)
    : procedures_{std::move(procedures)} {
  definitions_.reserve(definitions.size());
  for (auto& definition : definitions) {
    auto key = std::pair{definition.procedure_name, definition.error_name};
    if (by_name_.contains(key) || by_id_.contains(definition.error_id)) {
      spdlog::warn("Ignoring duplicate error definition {} ({}/{})",
                   definition.error_id, definition.procedure_name,
                   definition.error_name);
      continue;
    }
    by_name_.emplace(std::move(key), definitions_.size());
    by_id_.emplace(definition.error_id, definitions_.size());
    definitions_.push_back(std::move(definition));
  }
}

const schema::error_definition_t* catalog::find(
    const std::string_view procedure_name,
    const std::string_view error_name) const {
  auto found = by_name_.find(
      std::pair{std::string{procedure_name}, std::string{error_name}});
  if (found == by_name_.end()) {
    return nullptr;
  }
  return &definitions_[found->second];
}

const schema::error_definition_t* catalog::find(
    const schema::error_code_t error_id) const {
  auto found = by_id_.find(error_id);
  if (found == by_id_.end()) {
    return nullptr;
  }
  return &definitions_[found->second];
}

std::optional<std::string> catalog::procedure_name(
    const schema::procedure_id_t id) const {
  auto found = procedures_.find(id);
  if (found == procedures_.end()) {
    return std::nullopt;
  }
  return found->second;
}

std::optional<schema::procedure_id_t> catalog::procedure_id(
    const std::string_view name) const {
  for (const auto& [id, procedure] : procedures_) {
    if (procedure == name) {
      return id;
    }
  }
  return std::nullopt;
}

}  // namespace cascade::catalog
