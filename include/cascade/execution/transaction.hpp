#pragma once

#include <cstdint>

namespace cascade::execution {

/// Transaction state shared by the frames of one call chain.
class transaction_context final {
 public:
  bool active() const noexcept { return active_; }

  void begin();
  void commit();
  void rollback();

  uint64_t commits() const noexcept { return commits_; }
  uint64_t rollbacks() const noexcept { return rollbacks_; }

 private:
  bool active_{false};
  uint64_t commits_{};
  uint64_t rollbacks_{};
};

/// Frame-scoped view of a transaction_context.
///
/// The guard begins and owns the transaction when none is active at
/// construction, and otherwise borrows the caller's. Only an owning guard
/// commits or rolls back; it rolls back on destruction while the transaction
/// it owns is still active.
class transaction_guard final {
 public:
  explicit transaction_guard(transaction_context& context);
  ~transaction_guard();

  transaction_guard(const transaction_guard&) = delete;
  transaction_guard& operator=(const transaction_guard&) = delete;

  bool owns() const noexcept { return owns_; }

  void commit();
  void rollback();

 private:
  transaction_context& context_;
  bool owns_{false};
};

}  // namespace cascade::execution
