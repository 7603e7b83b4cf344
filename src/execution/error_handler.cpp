#include <cascade/catalog/lookup.hpp>
#include <cascade/common/failure.hpp>
#include <cascade/execution/error_handler.hpp>
#include <cascade/wire/codec.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <exception>
#include <utility>

namespace cascade::execution {

namespace {

void add_attribute(schema::context_node& context,
                   const std::string_view name,
                   const std::optional<std::string>& value) {
  if (value) {
    context.attributes.emplace_back(std::string{name}, *value);
  }
}

std::optional<std::string> to_optional_string(
    const std::optional<int32_t>& value) {
  if (!value) {
    return std::nullopt;
  }
  return std::to_string(*value);
}

std::optional<std::string> non_empty(const std::string& value) {
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::string_view to_string(const dispatch_path path) {
  switch (path) {
    case dispatch_path::reentry:
      return "reentry";
    case dispatch_path::user_defined:
      return "user_defined";
    case dispatch_path::known_host_failure:
      return "known_host_failure";
    case dispatch_path::unknown_host_failure:
      return "unknown_host_failure";
  }
  return "unknown";
}

std::map<schema::error_code_t, std::string> default_host_failures() {
  return {{1205, std::string{catalog::kDeadlock}},
          {2601, std::string{catalog::kIndexViolation}},
          {2627, std::string{catalog::kIndexViolation}}};
}

error_handler::error_handler(const catalog::catalog& errors,
                             const config::configuration& configuration,
                             audit::audit_log* audit,
                             handler_options options)
    : errors_(errors),
      configuration_(configuration),
      audit_(audit),
      options_(std::move(options)) {}

dispatch_path error_handler::classify(
    const schema::failure_state& failure) const {
  if (failure.procedure == options_.handler_name) {
    return dispatch_path::reentry;
  }
  if (failure.number >= common::kUserDefinedErrorNumber) {
    return dispatch_path::user_defined;
  }
  if (options_.host_failures.contains(failure.number)) {
    return dispatch_path::known_host_failure;
  }
  return dispatch_path::unknown_host_failure;
}

schema::context_node error_handler::session_context() const {
  auto context = schema::context_node{};
  add_attribute(context, "DB", options_.database_name);
  add_attribute(context, "SPID", to_optional_string(options_.session_id));
  return context;
}

dispatch_result error_handler::dispatch(
    const std::string_view calling_frame,
    const schema::failure_state& failure) const {
  auto result = dispatch_result{.path = classify(failure)};
  auto session = session_context();

  switch (result.path) {
    case dispatch_path::reentry: {
      auto context = schema::context_node{};
      add_attribute(context, "CalledBy", non_empty(std::string{calling_frame}));
      add_attribute(context, "Line", to_optional_string(failure.line));
      context.attributes.insert(std::end(context.attributes),
                                std::begin(session.attributes),
                                std::end(session.attributes));
      auto tree = catalog::wrap(errors_, failure.message, std::nullopt,
                                std::move(context));
      result.audit_message = wire::encode(tree);
      result.message = wire::fit(tree, options_.budget);
      break;
    }
    case dispatch_path::user_defined: {
      auto context = schema::context_node{};
      if (calling_frame != failure.procedure) {
        add_attribute(context, "CalledBy",
                      non_empty(std::string{calling_frame}));
      }
      add_attribute(context, "ThrownBy", non_empty(failure.procedure));
      add_attribute(context, "ThrownLine", to_optional_string(failure.line));
      context.attributes.insert(std::end(context.attributes),
                                std::begin(session.attributes),
                                std::end(session.attributes));
      auto tree =
          catalog::wrap(errors_, failure.message, std::move(context));
      result.audit_message = wire::encode(tree);
      result.message = wire::fit(tree, options_.budget);
      break;
    }
    case dispatch_path::known_host_failure:
    case dispatch_path::unknown_host_failure: {
      auto error_name =
          result.path == dispatch_path::known_host_failure
              ? options_.host_failures.at(failure.number)
              : std::string{catalog::kUnknownSystemError};
      auto procedure_id = errors_.procedure_id(calling_frame);

      auto context = schema::context_node{};
      add_attribute(context, "ErrorNumber", std::to_string(failure.number));
      add_attribute(context, "ErrorMessage", failure.message);
      add_attribute(context, catalog::kProcedureIdKey,
                    to_optional_string(procedure_id));
      add_attribute(context, "ThrownBy", non_empty(failure.procedure));
      add_attribute(context, "ThrownLine", to_optional_string(failure.line));
      add_attribute(context, "ServerName", options_.server_name);
      context.attributes.insert(std::end(context.attributes),
                                std::begin(session.attributes),
                                std::end(session.attributes));

      auto arguments = std::vector<schema::node_child_t>{};
      arguments.emplace_back(std::move(context));
      auto node = catalog::make_error(errors_, options_.handler_name,
                                      error_name, std::move(arguments));
      if (!procedure_id) {
        node.source_procedure = std::string{calling_frame};
      }
      result.message = wire::fit(node, options_.budget);
      result.audit_message = result.message;
      break;
    }
  }
  return result;
}

void error_handler::handle_failure(
    const std::string_view calling_frame,
    const std::optional<schema::audit_id_t> audit_id,
    std::optional<schema::failure_state> captured) const {
  auto failure = captured ? std::move(*captured)
                          : common::capture_failure(std::current_exception());

  if (configuration_.enabled(config::kDebugModeKey)) {
    spdlog::info("{}: {}{}: {}-{}", options_.handler_name,
                 failure.procedure.empty() ? "(null procedure)"
                                           : failure.procedure,
                 failure.line ? fmt::format("[{}]", *failure.line) : std::string{},
                 failure.number, failure.message);
    spdlog::info("{}: calling frame={} severity={} state={}",
                 options_.handler_name, calling_frame, failure.severity,
                 failure.state);
  }

  auto result = dispatch(calling_frame, failure);
  spdlog::debug("{} classified failure {} in {} as {}", options_.handler_name,
                failure.number, calling_frame, to_string(result.path));

  if (audit_ != nullptr) {
    audit_->fail(audit_id, std::move(result.audit_message));
  }

  throw common::failure{schema::failure_state{
      .number = common::kUserDefinedErrorNumber,
      .message = std::move(result.message),
      .procedure = options_.handler_name,
      .line = failure.line,
      .severity = failure.severity,
      .state = failure.state}};
}

}  // namespace cascade::execution
