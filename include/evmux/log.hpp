/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for evmux.
 * Provides EVMUX_LOG_DEBUG, EVMUX_LOG_INFO, EVMUX_LOG_WARN, EVMUX_LOG_ERROR
 * macros with a process-wide level threshold.
 */

#ifndef EVMUX_LOG_HPP_
#define EVMUX_LOG_HPP_

#include <atomic>
#include <iostream>
#include <string>
#include <string_view>

namespace evmux {

class Logger {
 public:
  enum class Level { kDebug = 0, kInfo = 1, kWarn = 2, kError = 3 };

  static void set_level(Level level) { threshold().store(static_cast<int>(level), std::memory_order_relaxed); }

  static Level level() { return static_cast<Level>(threshold().load(std::memory_order_relaxed)); }

  static bool enabled(Level level) {
    return static_cast<int>(level) >= threshold().load(std::memory_order_relaxed);
  }

  static void log(Level level, const std::string& msg) {
    if (!enabled(level)) {
      return;
    }
    const char* prefix[] = {"[DEBUG]", "[INFO]", "[WARN]", "[ERROR]"};
    std::cerr << "[evmux] " << prefix[static_cast<int>(level)] << " " << msg << std::endl;
  }

  // Accepts "debug", "info", "warn" and "error". Leaves *out untouched on failure.
  static bool parse_level(std::string_view name, Level* out) {
    Level parsed;
    if (name == "debug") {
      parsed = Level::kDebug;
    } else if (name == "info") {
      parsed = Level::kInfo;
    } else if (name == "warn" || name == "warning") {
      parsed = Level::kWarn;
    } else if (name == "error") {
      parsed = Level::kError;
    } else {
      return false;
    }
    *out = parsed;
    return true;
  }

 private:
  static std::atomic<int>& threshold() {
    static std::atomic<int> value{static_cast<int>(Level::kInfo)};
    return value;
  }
};

// The message expression is only evaluated when the level is enabled.
#define EVMUX_LOG_AT(level, msg)                \
  do {                                          \
    if (::evmux::Logger::enabled(level)) {      \
      ::evmux::Logger::log(level, (msg));       \
    }                                           \
  } while (0)

#define EVMUX_LOG_DEBUG(msg) EVMUX_LOG_AT(::evmux::Logger::Level::kDebug, msg)
#define EVMUX_LOG_INFO(msg) EVMUX_LOG_AT(::evmux::Logger::Level::kInfo, msg)
#define EVMUX_LOG_WARN(msg) EVMUX_LOG_AT(::evmux::Logger::Level::kWarn, msg)
#define EVMUX_LOG_ERROR(msg) EVMUX_LOG_AT(::evmux::Logger::Level::kError, msg)

}  // namespace evmux

#endif  // EVMUX_LOG_HPP_
