#include <cascade/execution/transaction.hpp>

#include <spdlog/spdlog.h>

namespace cascade::execution {

void transaction_context::begin() {
  if (active_) {
    spdlog::warn("Transaction already active; begin ignored");
    return;
  }
  active_ = true;
}

void transaction_context::commit() {
  if (!active_) {
    spdlog::warn("No active transaction to commit");
    return;
  }
  active_ = false;
  ++commits_;
}

void transaction_context::rollback() {
  if (!active_) {
    return;
  }
  active_ = false;
  ++rollbacks_;
  spdlog::debug("Transaction rolled back");
}

transaction_guard::transaction_guard(transaction_context& context)
    : context_(context) {
  if (!context_.active()) {
    context_.begin();
    owns_ = true;
  }
}

transaction_guard::~transaction_guard() {
  if (owns_ && context_.active()) {
    context_.rollback();
  }
}

void transaction_guard::commit() {
  if (owns_) {
    context_.commit();
  }
}

void transaction_guard::rollback() {
  if (owns_) {
    context_.rollback();
  }
}

}  // namespace cascade::execution
