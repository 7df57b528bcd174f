#pragma once

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace modelfetch {

enum class LogLevel {
    Trace = 0,
    Debug = 1,
    Info = 2,
    Warn = 3,
    Error = 4,
    Off = 6
};

// Returns the library logger, creating a console-only one on first use.
std::shared_ptr<spdlog::logger> logger();

// Replaces the sinks with a console sink plus an optional rotating file sink.
void initLogging(LogLevel level, const std::string& log_file = {});

void setLogLevel(LogLevel level);

} // namespace modelfetch

#define MODELFETCH_TRACE(...) ::modelfetch::logger()->trace(__VA_ARGS__)
#define MODELFETCH_DEBUG(...) ::modelfetch::logger()->debug(__VA_ARGS__)
#define MODELFETCH_INFO(...) ::modelfetch::logger()->info(__VA_ARGS__)
#define MODELFETCH_WARN(...) ::modelfetch::logger()->warn(__VA_ARGS__)
#define MODELFETCH_ERROR(...) ::modelfetch::logger()->error(__VA_ARGS__)
