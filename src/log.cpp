#include "mdns_scan/log.hpp"

#include <iostream>
#include <mutex>

#include <fmt/core.h>

namespace mdns_scan
{

namespace
{

void WriteToStderr(LogLevel level, std::string_view message)
{
    std::cerr << fmt::format("[{}] {}\n", ToString(level), message);
}

struct LoggerState
{
    std::mutex mutex;
    LoggerCallback callback{WriteToStderr};
    LogLevel minimum{LogLevel::Info};
};

LoggerState& GetState()
{
    static LoggerState state;
    return state;
}

}

std::string ToString(LogLevel level)
{
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "";
}

std::optional<LogLevel> ParseLogLevel(std::string_view text)
{
    for (const auto level : {LogLevel::Debug, LogLevel::Info, LogLevel::Warn, LogLevel::Error}) {
        if (text == ToString(level)) {
            return level;
        }
    }
    return std::nullopt;
}

void SetLogger(LoggerCallback callback, LogLevel minimum)
{
    auto& state = GetState();
    std::lock_guard<std::mutex> lock(state.mutex);
    state.callback = std::move(callback);
    state.minimum = minimum;
}

void ResetLogger()
{
    SetLogger(WriteToStderr, LogLevel::Info);
}

void Log(LogLevel level, std::string_view message)
{
    auto& state = GetState();
    std::lock_guard<std::mutex> lock(state.mutex);
    if (!state.callback || level < state.minimum) {
        return;
    }
    state.callback(level, message);
}

}
