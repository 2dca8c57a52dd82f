#pragma once

#include <string>

namespace vigil::util {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

// Process-wide diagnostic sink. Defaults to stderr at Warn.
void log_set_level(LogLevel lvl);
[[nodiscard]] LogLevel log_level();

// Redirect to an append-mode file and lower the threshold to Debug.
// Returns false (sink unchanged) if the file cannot be opened.
bool log_to_file(const std::string& path);
void log_to_stderr();

void logf(LogLevel lvl, const char* fmt, ...) __attribute__((format(printf, 2, 3)));

} // namespace vigil::util

#define VIGIL_LOG_DEBUG(...) ::vigil::util::logf(::vigil::util::LogLevel::Debug, __VA_ARGS__)
#define VIGIL_LOG_INFO(...)  ::vigil::util::logf(::vigil::util::LogLevel::Info, __VA_ARGS__)
#define VIGIL_LOG_WARN(...)  ::vigil::util::logf(::vigil::util::LogLevel::Warn, __VA_ARGS__)
#define VIGIL_LOG_ERROR(...) ::vigil::util::logf(::vigil::util::LogLevel::Error, __VA_ARGS__)
