#include "modelfetch/log.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <mutex>
#include <vector>

namespace modelfetch {

namespace {

constexpr const char* kLoggerName = "modelfetch";

std::mutex& loggerMutex() {
    static std::mutex mutex;
    return mutex;
}

std::shared_ptr<spdlog::logger>& loggerSlot() {
    static std::shared_ptr<spdlog::logger> instance;
    return instance;
}

std::shared_ptr<spdlog::logger> makeConsoleLogger() {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");
    auto created = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
    created->set_level(spdlog::level::info);
    return created;
}

} // namespace

std::shared_ptr<spdlog::logger> logger() {
    std::lock_guard<std::mutex> lock(loggerMutex());
    auto& slot = loggerSlot();
    if (!slot) {
        slot = makeConsoleLogger();
    }
    return slot;
}

void initLogging(LogLevel level, const std::string& log_file) {
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_pattern("[%H:%M:%S] [%^%l%$] [%t] %v");

    std::vector<spdlog::sink_ptr> sinks{console_sink};
    std::string file_error;
    if (!log_file.empty()) {
        try {
            auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 5, 3); // 5MB, 3 files
            file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%t] %v");
            sinks.push_back(std::move(file_sink));
        } catch (const spdlog::spdlog_ex& ex) {
            file_error = ex.what();
        }
    }

    auto created = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
    created->set_level(static_cast<spdlog::level::level_enum>(level));
    {
        std::lock_guard<std::mutex> lock(loggerMutex());
        loggerSlot() = created;
    }

    if (!file_error.empty()) {
        created->error("Cannot open log file {}: {}", log_file, file_error);
    }
}

void setLogLevel(LogLevel level) {
    logger()->set_level(static_cast<spdlog::level::level_enum>(level));
}

} // namespace modelfetch
