#include <cascade/catalog/defaults.hpp>
#include <cascade/config/configuration.hpp>

#include <spdlog/spdlog.h>

namespace cascade::catalog {

std::vector<schema::error_definition_t> default_error_definitions() {
  return {
      schema::error_definition_t{
          .error_id = 1000,
          .procedure_name = std::string{kFallbackProcedure},
          .error_name = std::string{kUnknownError},
          .user_message = std::string{kBuiltinUserMessage}},
      schema::error_definition_t{
          .error_id = 1001,
          .procedure_name = std::string{kFallbackProcedure},
          .error_name = std::string{kUnknownSystemError},
          .user_message = "Unknown system error on server #ServerName# from "
                          "database #DB#. #ErrorMessage#"},
      schema::error_definition_t{
          .error_id = 1002,
          .procedure_name = std::string{kFallbackProcedure},
          .error_name = std::string{kIndexViolation},
          .user_message = "Unable to perform this operation because there is "
                          "another record with the same name at the same "
                          "location.",
          .developer_message = "#ErrorMessage#"},
      schema::error_definition_t{
          .error_id = 1003,
          .procedure_name = std::string{kFallbackProcedure},
          .error_name = std::string{kDeadlock},
          .user_message = "System is currently busy, please try again later.",
          .developer_message =
              "Database deadlock error occurred. #ErrorMessage#"},
      schema::error_definition_t{
          .error_id = 1100,
          .procedure_name = std::string{kMaintenanceProcedure},
          .error_name = std::string{kUnknownError},
          .user_message = "Unknown error message \"#ErrorName#\" for "
                          "procedure \"#ProcedureName#\" is not defined in "
                          "the error table."},
  };
}

std::vector<schema::parameter_t> default_parameters() {
  return {
      schema::parameter_t{
          .name = std::string{config::kAuditReadLogKey},
          .value = "false",
          .description =
              "Controls logging of read procedure calls into the audit log."},
      schema::parameter_t{
          .name = std::string{config::kAuditWriteLogKey},
          .value = "false",
          .description = "Controls logging of create and update procedure "
                         "calls into the audit log."},
      schema::parameter_t{
          .name = std::string{config::kDebugModeKey},
          .value = "false",
          .description = "Controls display of debugging messages."},
      schema::parameter_t{
          .name = std::string{config::kPurgePeriodKey},
          .value = "<TimeSpan Month=\"0\" Week=\"1\" Day=\"0\"/>",
          .description =
              "Defines how long audit log information should be retained."},
  };
}

void seed(const storage::storage_t& store) {
  store.replace_error_definitions(default_error_definitions());

  auto inserted = std::size_t{};
  for (auto parameter : default_parameters()) {
    if (auto existing = store.get_parameter(parameter.name)) {
      existing->description = std::move(parameter.description);
      store.put_parameter(*existing);
      continue;
    }
    store.put_parameter(parameter);
    ++inserted;
  }
  spdlog::info("Seeded error catalog; {} new parameter(s)", inserted);
}

catalog load_catalog(const storage::storage_t& store) {
  auto definitions = store.list_error_definitions();
  auto procedures = store.list_procedures();
  spdlog::debug("Loaded {} error definition(s) and {} procedure(s)",
                definitions.size(), procedures.size());
  return catalog{std::move(definitions), std::move(procedures)};
}

}  // namespace cascade::catalog
