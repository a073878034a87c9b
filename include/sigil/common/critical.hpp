#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace sigil::common {

/// Log, flush and terminate. Reserved for infrastructure failures (storage
/// I/O, corrupt persisted values) and misuse of the fatal codec variants.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace sigil::common
