#pragma once

#include <csignal>
#include <exception>
#include <string_view>

#include <spdlog/spdlog.h>

namespace bulletin::common {

/// Log an unrecoverable failure, flush the loggers and terminate.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::raise(SIGTERM);
  std::terminate();
}

}  // namespace bulletin::common
