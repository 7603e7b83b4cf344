#pragma once

#include <cascade/audit/audit_log.hpp>
#include <cascade/catalog/catalog.hpp>
#include <cascade/config/configuration.hpp>
#include <cascade/schema/error_node.hpp>
#include <cascade/schema/failure_state.hpp>
#include <cascade/wire/truncation.hpp>
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace cascade::execution {

/// How a failure reaching a frame boundary was classified.
enum class dispatch_path : uint8_t {
  /// Raised by the handler itself one frame down; already structured.
  reentry,
  /// Raised by a frame through a catalog lookup.
  user_defined,
  /// Host failure with a dedicated catalog entry.
  known_host_failure,
  /// Any other host failure.
  unknown_host_failure
};

std::string_view to_string(dispatch_path path);

/// Host failure numbers with a dedicated catalog entry of the handler.
std::map<schema::error_code_t, std::string> default_host_failures();

struct handler_options final {
  std::string handler_name{catalog::kFallbackProcedure};
  std::size_t budget{wire::kDefaultBudget};
  std::map<schema::error_code_t, std::string> host_failures{
      default_host_failures()};
  std::optional<std::string> server_name;
  std::optional<std::string> database_name;
  std::optional<int32_t> session_id;
};

struct dispatch_result final {
  dispatch_path path{dispatch_path::unknown_host_failure};
  /// Bounded text re-signaled to the caller.
  std::string message;
  /// Text stored in the audit entry: the whole tree on the structured paths,
  /// the bounded text on the host paths.
  std::string audit_message;
};

/// Classifies failures at frame boundaries, composes the structured error,
/// closes the audit entry and re-signals the bounded text.
class error_handler final {
 public:
  error_handler(const catalog::catalog& errors,
                const config::configuration& configuration,
                audit::audit_log* audit = nullptr,
                handler_options options = {});

  /// Classify `failure` as seen by `calling_frame` and compose the messages.
  /// Has no side effects.
  dispatch_result dispatch(std::string_view calling_frame,
                           const schema::failure_state& failure) const;

  /// Handle the captured failure, or the one in flight when `captured` is
  /// empty. Closes the audit entry `audit_id` with the failure and throws
  /// common::failure with the bounded message, the handler name, and the
  /// original line, severity and state.
  [[noreturn]] void handle_failure(
      std::string_view calling_frame,
      std::optional<schema::audit_id_t> audit_id = std::nullopt,
      std::optional<schema::failure_state> captured = std::nullopt) const;

  const catalog::catalog& errors() const { return errors_; }
  audit::audit_log* audit() const { return audit_; }
  const handler_options& options() const { return options_; }

 private:
  dispatch_path classify(const schema::failure_state& failure) const;
  schema::context_node session_context() const;

  const catalog::catalog& errors_;
  const config::configuration& configuration_;
  audit::audit_log* audit_;
  handler_options options_;
};

}  // namespace cascade::execution
