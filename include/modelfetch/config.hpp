#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#define MODELFETCH_VERSION "1.0.0"

namespace modelfetch {

struct ManagerConfig {
    std::filesystem::path base_dir{"models"};
    std::string temp_dir_name{".downloads"};
    std::filesystem::path state_dir; // empty = base_dir/.state
    std::chrono::milliseconds grace_delay{1000};
    std::chrono::milliseconds progress_interval{500};
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds low_speed_time{60};
    std::string user_agent{"modelfetch/" MODELFETCH_VERSION};
    std::string auth_token; // never persisted
    bool resume_on_foreground{false};

    [[nodiscard]] std::filesystem::path tempDir() const { return base_dir / temp_dir_name; }
    [[nodiscard]] std::filesystem::path stateDir() const { return state_dir.empty() ? base_dir / ".state" : state_dir; }
};

// Overlays the keys found in a JSON file onto `base`. Unknown keys are
// ignored; a missing file, bad JSON or a wrongly typed value throws
// InvalidArgumentError.
[[nodiscard]] ManagerConfig loadConfigFile(const std::filesystem::path& path, ManagerConfig base = {});

} // namespace modelfetch
