#pragma once

#include <csignal>
#include <exception>
#include <utility>

#include <spdlog/spdlog.h>

namespace bulwark::common {

/// Log at critical level and terminate. Only for broken internal invariants
/// (unreadable storage, undecodable records written by this process);
/// anything a caller can cause is reported through operation_result_t.
template <typename... Args>
[[noreturn]] void critical(spdlog::format_string_t<Args...> format,
                           Args&&... args) {
  spdlog::critical(format, std::forward<Args>(args)...);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace bulwark::common
