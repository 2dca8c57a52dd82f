#include "util/Log.hpp"

#include <atomic>
#include <cerrno>
#include <cstdarg>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <mutex>

namespace vigil::util {

static std::mutex g_log_mu;
static std::FILE* g_log_file = nullptr; // nullptr => stderr
static std::atomic<int> g_level{static_cast<int>(LogLevel::Warn)};

static const char* level_name(LogLevel lvl) {
  switch (lvl) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info:  return "info";
    case LogLevel::Warn:  return "warn";
    case LogLevel::Error: return "error";
  }
  return "?";
}

void log_set_level(LogLevel lvl) { g_level.store(static_cast<int>(lvl), std::memory_order_relaxed); }

LogLevel log_level() { return static_cast<LogLevel>(g_level.load(std::memory_order_relaxed)); }

bool log_to_file(const std::string& path) {
  std::FILE* f = std::fopen(path.c_str(), "a");
  if (!f) {
    std::fprintf(stderr, "vigil: error: cannot open debug log %s: %s\n", path.c_str(), std::strerror(errno));
    return false;
  }
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (g_log_file) std::fclose(g_log_file);
  g_log_file = f;
  g_level.store(static_cast<int>(LogLevel::Debug), std::memory_order_relaxed);
  return true;
}

void log_to_stderr() {
  std::lock_guard<std::mutex> lk(g_log_mu);
  if (g_log_file) std::fclose(g_log_file);
  g_log_file = nullptr;
}

void logf(LogLevel lvl, const char* fmt, ...) {
  if (static_cast<int>(lvl) < g_level.load(std::memory_order_relaxed)) return;
  char msg[1024];
  va_list ap;
  va_start(ap, fmt);
  std::vsnprintf(msg, sizeof(msg), fmt, ap);
  va_end(ap);

  std::lock_guard<std::mutex> lk(g_log_mu);
  std::FILE* out = g_log_file ? g_log_file : stderr;
  if (g_log_file) {
    // File sink gets a wall-clock prefix; stderr lines stay terse
    auto now_t = std::time(nullptr);
    std::tm tm{};
    ::localtime_r(&now_t, &tm);
    char ts[32];
    std::strftime(ts, sizeof(ts), "%Y-%m-%d %H:%M:%S", &tm);
    std::fprintf(out, "%s vigil: %s: %s\n", ts, level_name(lvl), msg);
  } else {
    std::fprintf(out, "vigil: %s: %s\n", level_name(lvl), msg);
  }
  std::fflush(out);
}

} // namespace vigil::util
