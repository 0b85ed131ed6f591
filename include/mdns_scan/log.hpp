#pragma once

#include <functional>
#include <optional>
#include <string>
#include <string_view>

namespace mdns_scan
{

enum class LogLevel
{
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};
std::string ToString(LogLevel level);
std::optional<LogLevel> ParseLogLevel(std::string_view text);

using LoggerCallback = std::function<void(LogLevel, std::string_view)>;

// Replaces the sink for all later Log calls. Messages below minimum are dropped.
// An empty callback discards everything.
void SetLogger(LoggerCallback callback, LogLevel minimum = LogLevel::Info);
// Back to "[level] message" lines on std::cerr
void ResetLogger();

void Log(LogLevel level, std::string_view message);

}
