#pragma once

#include <csignal>
#include <exception>
#include <source_location>
#include <string_view>

#include <spdlog/spdlog.h>

namespace cascade::common {

/// Stop the process on a fault that leaves the stores in an unknown state.
/// `detail` is the backend's own description of the fault, if any. The log
/// line names the call site so the failing store operation can be found.
[[noreturn]] inline void critical(
    const std::string_view message,
    const std::string_view detail = {},
    const std::source_location location = std::source_location::current()) {
  if (detail.empty()) {
    spdlog::critical("{} [{}:{}]", message, location.file_name(),
                     location.line());
  } else {
    spdlog::critical("{}: {} [{}:{}]", message, detail, location.file_name(),
                     location.line());
  }
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace cascade::common
