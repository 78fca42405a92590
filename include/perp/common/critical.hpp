#pragma once

#include <csignal>
#include <exception>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>

namespace perp::common {

/// Flushes every logger and terminates. Only for states the caller cannot
/// recover from, such as malformed tool input or a failed `encode` wrapper.
[[noreturn]] inline void terminate_after_logging() {
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  terminate_after_logging();
}

template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  terminate_after_logging();
}

}  // namespace perp::common
