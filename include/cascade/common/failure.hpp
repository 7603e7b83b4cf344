#pragma once

#include <cascade/schema/failure_state.hpp>
#include <exception>
#include <stdexcept>

namespace cascade::common {

/// Failure numbers at or above this value are raised by frames themselves.
inline constexpr auto kUserDefinedErrorNumber =
    cascade::schema::error_code_t{50000};

/// Unique key violation reported by the storage layer.
inline constexpr auto kUniqueIndexViolation =
    cascade::schema::error_code_t{2601};

/// Signaled failure. what() is the failure message, which is the encoded
/// structured error once a frame has handled it.
class failure final : public std::runtime_error {
 public:
  explicit failure(cascade::schema::failure_state state);

  const cascade::schema::failure_state& state() const noexcept;
  cascade::schema::error_code_t number() const noexcept;
  const std::string& procedure() const noexcept;

 private:
  cascade::schema::failure_state state_;
};

/// Snapshot the failure carried by `error`. Exceptions that are not a
/// `failure` get number 0 and no procedure; exceptions that do not derive
/// from std::exception are rethrown.
cascade::schema::failure_state capture_failure(std::exception_ptr error);

}  // namespace cascade::common
