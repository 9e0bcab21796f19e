#include "mcpws/log.hpp"

#include <cstdio>
#include <ctime>

#include <chrono>
#include <fstream>
#include <iostream>
#include <mutex>

namespace mcpws {

namespace {

struct Sink {
  std::mutex mutex;
  std::ofstream file;
};

Sink& sink() {
  static Sink s;
  return s;
}

std::string timestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t secs = std::chrono::system_clock::to_time_t(now);
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm_buf{};
  localtime_r(&secs, &tm_buf);
  char buf[32];
  size_t n = std::strftime(buf, sizeof(buf), "%Y-%m-%d %H:%M:%S", &tm_buf);
  char out[40];
  std::snprintf(out, sizeof(out), "%.*s.%03d", static_cast<int>(n), buf, static_cast<int>(ms));
  return out;
}

}  // namespace

const char* Logger::level_name(Level level) {
  switch (level) {
    case Level::kTrace: return "TRACE";
    case Level::kDebug: return "DEBUG";
    case Level::kInfo: return "INFO";
    case Level::kWarn: return "WARN";
    case Level::kError: return "ERROR";
    case Level::kOff: return "OFF";
  }
  return "?";
}

void Logger::log(Level level, std::string_view component, const std::string& msg) {
  if (!enabled(level)) {
    return;
  }
  std::string line = timestamp();
  line += " [";
  line += level_name(level);
  line += "] [";
  line.append(component.data(), component.size());
  line += "] ";
  line += msg;

  Sink& s = sink();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.file.is_open()) {
    s.file << line << '\n';
    s.file.flush();
  } else {
    std::cerr << line << std::endl;
  }
}

bool Logger::set_file(const std::string& path) {
  Sink& s = sink();
  std::lock_guard<std::mutex> lock(s.mutex);
  if (s.file.is_open()) {
    s.file.close();
  }
  if (path.empty()) {
    return true;
  }
  s.file.open(path, std::ios::out | std::ios::app);
  return s.file.is_open();
}

bool Logger::parse_level(std::string_view name, Level& out) {
  if (name == "trace") {
    out = Level::kTrace;
  } else if (name == "debug") {
    out = Level::kDebug;
  } else if (name == "info") {
    out = Level::kInfo;
  } else if (name == "warn" || name == "warning") {
    out = Level::kWarn;
  } else if (name == "error") {
    out = Level::kError;
  } else if (name == "off") {
    out = Level::kOff;
  } else {
    return false;
  }
  return true;
}

}  // namespace mcpws
