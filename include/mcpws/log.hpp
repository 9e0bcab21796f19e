/**
 * MIT License
 *
 * Copyright (c) 2026 liudegui
 *
 * Logging utilities for mcpws (loghelper-compatible interface).
 * Provides MCPWS_LOG_TRACE ... MCPWS_LOG_ERROR macros with a component tag.
 */

#ifndef MCPWS_LOG_HPP_
#define MCPWS_LOG_HPP_

#include <atomic>
#include <sstream>
#include <string>
#include <string_view>

namespace mcpws {

class Logger {
 public:
  enum class Level { kTrace = 0, kDebug, kInfo, kWarn, kError, kOff };

  static void log(Level level, std::string_view component, const std::string& msg);

  static void set_level(Level level) { threshold().store(level, std::memory_order_relaxed); }
  static Level level() { return threshold().load(std::memory_order_relaxed); }
  static bool enabled(Level level) { return level >= Logger::level() && level != Level::kOff; }

  // Appends to path instead of stderr; an empty path restores stderr.
  // Returns false if the file cannot be opened.
  static bool set_file(const std::string& path);

  // Accepts "trace", "debug", "info", "warn"/"warning", "error", "off".
  static bool parse_level(std::string_view name, Level& out);
  static const char* level_name(Level level);

 private:
  static std::atomic<Level>& threshold() {
    static std::atomic<Level> lvl{Level::kInfo};
    return lvl;
  }
};

}  // namespace mcpws

#define MCPWS_LOG_AT(lvl, component, expr)                           \
  do {                                                               \
    if (::mcpws::Logger::enabled(lvl)) {                             \
      std::ostringstream mcpws_log_os_;                              \
      mcpws_log_os_ << expr;                                         \
      ::mcpws::Logger::log(lvl, component, mcpws_log_os_.str());     \
    }                                                                \
  } while (0)

#define MCPWS_LOG_TRACE(component, expr) MCPWS_LOG_AT(::mcpws::Logger::Level::kTrace, component, expr)
#define MCPWS_LOG_DEBUG(component, expr) MCPWS_LOG_AT(::mcpws::Logger::Level::kDebug, component, expr)
#define MCPWS_LOG_INFO(component, expr) MCPWS_LOG_AT(::mcpws::Logger::Level::kInfo, component, expr)
#define MCPWS_LOG_WARN(component, expr) MCPWS_LOG_AT(::mcpws::Logger::Level::kWarn, component, expr)
#define MCPWS_LOG_ERROR(component, expr) MCPWS_LOG_AT(::mcpws::Logger::Level::kError, component, expr)

#endif  // MCPWS_LOG_HPP_
