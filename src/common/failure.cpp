#include <cascade/common/failure.hpp>

#include <utility>

namespace cascade::common {

failure::failure(cascade::schema::failure_state state)
    : std::runtime_error(state.message), state_(std::move(state)) {}

const cascade::schema::failure_state& failure::state() const noexcept {
  return state_;
}

cascade::schema::error_code_t failure::number() const noexcept {
  return state_.number;
}

const std::string& failure::procedure() const noexcept {
  return state_.procedure;
}

cascade::schema::failure_state capture_failure(std::exception_ptr error) {
  if (!error) {
    return cascade::schema::failure_state{.number = 0,
                                          .message = "no failure in flight"};
  }
  try {
    std::rethrow_exception(error);
  } catch (const failure& e) {
    return e.state();
  } catch (const std::exception& e) {
    return cascade::schema::failure_state{.number = 0, .message = e.what()};
  }
}

}  // namespace cascade::common
