#include <cascade/catalog/lookup.hpp>
#include <cascade/common/failure.hpp>
#include <cascade/execution/frame.hpp>
#include <cascade/wire/codec.hpp>

#include <spdlog/spdlog.h>

namespace cascade::execution {

namespace {

constexpr auto kUnknownExceptionMessage =
    std::string_view{"exception of unknown type"};

}  // namespace

frame::frame(const error_handler& handler,
             transaction_context& transactions,
             std::string procedure_name,
             const bool read_only,
             std::optional<std::string> input_data)
    : handler_(handler),
      procedure_name_(std::move(procedure_name)),
      transaction_(transactions) {
  if (auto* audit = handler_.audit()) {
    audit_id_ = audit->begin(procedure_name_, read_only, std::move(input_data));
  }
}

void frame::complete(std::optional<std::string> output_data) {
  if (completed_) {
    return;
  }
  completed_ = true;
  transaction_.commit();
  if (auto* audit = handler_.audit()) {
    audit->end(audit_id_, std::move(output_data));
  }
}

void frame::raise(const std::string_view error_name,
                  std::vector<schema::node_child_t> arguments,
                  const std::source_location location) const {
  auto message =
      catalog::lookup(handler_.errors(), procedure_name_, error_name,
                      std::move(arguments), handler_.options().budget);
  throw common::failure{schema::failure_state{
      .number = common::kUserDefinedErrorNumber,
      .message = std::move(message),
      .procedure = procedure_name_,
      .line = static_cast<int32_t>(location.line())}};
}

void frame::raise(const std::string_view error_name,
                  schema::context_node context,
                  const std::source_location location) const {
  auto arguments = std::vector<schema::node_child_t>{};
  if (!context.empty()) {
    arguments.emplace_back(std::move(context));
  }
  raise(error_name, std::move(arguments), location);
}

void frame::fail() {
  auto captured = common::capture_failure(std::current_exception());
  if (transaction_.owns()) {
    transaction_.rollback();
  }
  completed_ = true;
  spdlog::debug("Frame {} failed with {}", procedure_name_, captured.number);
  handler_.handle_failure(procedure_name_, audit_id_, std::move(captured));
}

void frame::abandon() {
  if (transaction_.owns()) {
    transaction_.rollback();
  }
  completed_ = true;
  spdlog::error("Frame {} failed with an exception of unknown type",
                procedure_name_);
  if (auto* audit = handler_.audit()) {
    auto node = catalog::wrap(handler_.errors(), kUnknownExceptionMessage);
    audit->fail(audit_id_, wire::encode(node));
  }
}

}  // namespace cascade::execution
