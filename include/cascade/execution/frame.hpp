#pragma once

#include <cascade/execution/error_handler.hpp>
#include <cascade/execution/transaction.hpp>
#include <cascade/schema/error_node.hpp>
#include <cascade/schema/primitives.hpp>
#include <exception>
#include <optional>
#include <source_location>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

namespace cascade::execution {

/// One invocation of a procedure in a call chain.
///
/// Construction opens the audit entry and owns or borrows the transaction.
/// run() executes a body: on success the frame completes; on failure it rolls
/// back an owned transaction and hands the failure to the error handler,
/// which re-signals it to the enclosing frame. Exceptions that do not derive
/// from std::exception cannot be classified: the frame rolls back, closes its
/// audit entry with a generic error and lets them propagate unchanged.
class frame final {
 public:
  frame(const error_handler& handler,
        transaction_context& transactions,
        std::string procedure_name,
        bool read_only = false,
        std::optional<std::string> input_data = std::nullopt);

  frame(const frame&) = delete;
  frame& operator=(const frame&) = delete;

  template <typename Body>
  auto run(Body&& body) -> std::invoke_result_t<Body, frame&>;

  /// Commit an owned transaction and close the audit entry. Only the first
  /// call has an effect.
  void complete(std::optional<std::string> output_data = std::nullopt);

  /// Signal the catalog error `error_name` of this procedure.
  [[noreturn]] void raise(
      std::string_view error_name,
      std::vector<schema::node_child_t> arguments,
      std::source_location location = std::source_location::current()) const;
  [[noreturn]] void raise(
      std::string_view error_name,
      schema::context_node context = {},
      std::source_location location = std::source_location::current()) const;

  /// Roll back an owned transaction and dispatch the failure in flight.
  [[noreturn]] void fail();

  const std::string& procedure_name() const { return procedure_name_; }
  std::optional<schema::audit_id_t> audit_id() const { return audit_id_; }
  bool owns_transaction() const { return transaction_.owns(); }

 private:
  void abandon();

  const error_handler& handler_;
  std::string procedure_name_;
  transaction_guard transaction_;
  std::optional<schema::audit_id_t> audit_id_;
  bool completed_{false};
};

template <typename Body>
auto frame::run(Body&& body) -> std::invoke_result_t<Body, frame&> {
  try {
    if constexpr (std::is_void_v<std::invoke_result_t<Body, frame&>>) {
      std::forward<Body>(body)(*this);
      complete();
    } else {
      auto result = std::forward<Body>(body)(*this);
      complete();
      return result;
    }
  } catch (const std::exception&) {
    fail();
  } catch (...) {
    abandon();
    throw;
  }
}

}  // namespace cascade::execution
