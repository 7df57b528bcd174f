#include "modelfetch/config.hpp"

#include "modelfetch/errors.hpp"

#include <fstream>

#include <fmt/format.h>
#include <nlohmann/json.hpp>

namespace modelfetch {

namespace {

using nlohmann::json;

template <typename T>
bool readValue(const json& document, const char* key, T& out) {
    auto it = document.find(key);
    if (it == document.end()) {
        return false;
    }
    try {
        out = it->get<T>();
    } catch (const json::type_error&) {
        throw InvalidArgumentError(fmt::format("Config key '{}' has the wrong type", key));
    }
    return true;
}

template <typename Duration>
void readDuration(const json& document, const char* key, Duration& out) {
    std::int64_t value = 0;
    if (!readValue(document, key, value)) {
        return;
    }
    if (value < 0) {
        throw InvalidArgumentError(fmt::format("Config key '{}' must not be negative", key));
    }
    out = Duration(value);
}

} // namespace

ManagerConfig loadConfigFile(const std::filesystem::path& path, ManagerConfig base) {
    std::ifstream input(path);
    if (!input) {
        throw InvalidArgumentError(fmt::format("Cannot open config file {}", path.string()));
    }

    json document;
    try {
        document = json::parse(input);
    } catch (const json::parse_error& ex) {
        throw InvalidArgumentError(fmt::format("Config file {} is not valid JSON: {}", path.string(), ex.what()));
    }
    if (!document.is_object()) {
        throw InvalidArgumentError(fmt::format("Config file {} must hold a JSON object", path.string()));
    }

    std::string text;
    if (readValue(document, "base_dir", text)) {
        base.base_dir = text;
    }
    if (readValue(document, "state_dir", text)) {
        base.state_dir = text;
    }
    if (readValue(document, "temp_dir_name", text)) {
        if (text.empty() || text.find('/') != std::string::npos) {
            throw InvalidArgumentError("Config key 'temp_dir_name' must be a plain directory name");
        }
        base.temp_dir_name = text;
    }
    readValue(document, "user_agent", base.user_agent);
    readValue(document, "auth_token", base.auth_token);
    readValue(document, "resume_on_foreground", base.resume_on_foreground);
    readDuration(document, "grace_delay_ms", base.grace_delay);
    readDuration(document, "progress_interval_ms", base.progress_interval);
    readDuration(document, "connect_timeout_s", base.connect_timeout);
    readDuration(document, "low_speed_time_s", base.low_speed_time);
    return base;
}

} // namespace modelfetch
