#include "modelfetch/config.hpp"
#include "modelfetch/console_panel.hpp"
#include "modelfetch/curl_http_client.hpp"
#include "modelfetch/detail/curl_utils.hpp"
#include "modelfetch/download_manager.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/lifecycle_bridge.hpp"
#include "modelfetch/log.hpp"
#include "modelfetch/state_store.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <fmt/format.h>

namespace {

std::atomic<bool> g_interrupted{false};

extern "C" void onSignal(int) { g_interrupted.store(true); }

void printUsage(const char* programName) {
    std::cerr << "Usage: " << programName << " [options] [<url1> <file1> [<url2> <file2> ...]]" << std::endl;
    std::cerr << "Options:\n"
              << "  -d <directory>       Model directory (default: ./models)\n"
              << "  --state-dir <dir>    Where download state is kept (default: <directory>/.state)\n"
              << "  --config <file>      JSON configuration file\n"
              << "  --token <token>      Bearer token (default: $MODELFETCH_TOKEN or $HF_TOKEN)\n"
              << "  --resume             Resume every paused download\n"
              << "  --list               List downloads and stored models, then exit\n"
              << "  --delete <file>      Delete a stored model (or forget a linked one), then exit\n"
              << "  --link <file> <name> List a model file kept elsewhere under <name>, then exit\n"
              << "  --clear              Delete every stored model and forget linked ones, then exit\n"
              << "  --log-file <file>    Also write logs to a rotating file\n"
              << "  -v                   Verbose logging (repeat for trace)\n"
              << "  -h, --help           Show this message" << std::endl;
}

struct CliOptions {
    std::optional<std::filesystem::path> base_dir;
    std::optional<std::filesystem::path> state_dir;
    std::optional<std::filesystem::path> config_file;
    std::optional<std::string> token;
    std::optional<std::string> delete_target;
    std::optional<std::pair<std::string, std::string>> link; // path, name
    std::string log_file;
    int verbosity{0};
    bool list{false};
    bool resume{false};
    bool clear{false};
    std::vector<std::pair<std::string, std::string>> downloads; // url, filename
};

std::optional<std::string> envToken() {
    for (const char* name : {"MODELFETCH_TOKEN", "HF_TOKEN"}) {
        const char* value = std::getenv(name);
        if (value && *value) {
            return std::string(value);
        }
    }
    return std::nullopt;
}

void printListing(const modelfetch::DownloadManager& manager) {
    const auto records = manager.records();
    std::cout << fmt::format("Downloads ({}):\n", records.size());
    for (const auto& [filename, record] : records) {
        std::cout << fmt::format("  #{:<4} {:<24} {:<11} {:>3}% {}/{}{}\n",
                                 record.download_id,
                                 filename,
                                 modelfetch::toString(record.status),
                                 record.progress(),
                                 modelfetch::ConsoleProgressPanel::formatSize(record.bytes_downloaded),
                                 modelfetch::ConsoleProgressPanel::formatSize(record.total_bytes),
                                 record.error ? "  " + *record.error : std::string());
    }

    const auto models = manager.getStoredModels();
    std::cout << fmt::format("Stored models ({}):\n", models.size());
    for (const auto& model : models) {
        std::cout << fmt::format("  {:<32} {:>10}  {}{}\n",
                                 model.name,
                                 modelfetch::ConsoleProgressPanel::formatSize(model.size),
                                 model.modified,
                                 model.is_external ? "  -> " + model.path : std::string());
    }
}

} // namespace

int main(int argc, char** argv) {
    CliOptions options;
    int arg_index = 1;

    auto requireValue = [&](const std::string& option) -> std::optional<std::string> {
        if (arg_index + 1 >= argc) {
            std::cerr << "Missing value for " << option << std::endl;
            return std::nullopt;
        }
        arg_index += 2;
        return std::string(argv[arg_index - 1]);
    };

    while (arg_index < argc && argv[arg_index][0] == '-') {
        const std::string option = argv[arg_index];
        std::optional<std::string> value;

        if (option == "-h" || option == "--help") {
            printUsage(argv[0]);
            return 0;
        } else if (option == "-v" || option == "-vv") {
            options.verbosity += option == "-vv" ? 2 : 1;
            ++arg_index;
            continue;
        } else if (option == "--list") {
            options.list = true;
            ++arg_index;
            continue;
        } else if (option == "--resume") {
            options.resume = true;
            ++arg_index;
            continue;
        } else if (option == "--clear") {
            options.clear = true;
            ++arg_index;
            continue;
        } else if (option == "--link") {
            if (arg_index + 2 >= argc) {
                std::cerr << "--link needs a file and a name" << std::endl;
                printUsage(argv[0]);
                return 1;
            }
            options.link = std::make_pair(std::string(argv[arg_index + 1]), std::string(argv[arg_index + 2]));
            arg_index += 3;
            continue;
        } else if (option == "-d" || option == "--state-dir" || option == "--config" || option == "--token" ||
                   option == "--delete" || option == "--log-file") {
            value = requireValue(option);
            if (!value) {
                printUsage(argv[0]);
                return 1;
            }
        } else {
            printUsage(argv[0]);
            return 1;
        }

        if (option == "-d") {
            options.base_dir = *value;
        } else if (option == "--state-dir") {
            options.state_dir = *value;
        } else if (option == "--config") {
            options.config_file = *value;
        } else if (option == "--token") {
            options.token = *value;
        } else if (option == "--delete") {
            options.delete_target = *value;
        } else {
            options.log_file = *value;
        }
    }

    if ((argc - arg_index) % 2 != 0) {
        printUsage(argv[0]);
        return 1;
    }
    for (int i = arg_index; i < argc; i += 2) {
        options.downloads.emplace_back(argv[i], argv[i + 1]);
    }
    if (options.downloads.empty() && !options.list && !options.resume && !options.delete_target && !options.link &&
        !options.clear) {
        printUsage(argv[0]);
        return 1;
    }

    // 面板占用 stdout, 默认只让警告以上的日志出现在终端
    const auto level = options.verbosity >= 2   ? modelfetch::LogLevel::Trace
                       : options.verbosity == 1 ? modelfetch::LogLevel::Debug
                                                : modelfetch::LogLevel::Warn;
    modelfetch::initLogging(level, options.log_file);

    try {
        modelfetch::detail::ensureCurlInitialized();

        modelfetch::ManagerConfig config;
        if (options.config_file) {
            config = modelfetch::loadConfigFile(*options.config_file);
        }
        if (options.base_dir) {
            config.base_dir = *options.base_dir;
        }
        if (options.state_dir) {
            config.state_dir = *options.state_dir;
        }
        if (options.token) {
            config.auth_token = *options.token;
        } else if (config.auth_token.empty()) {
            config.auth_token = envToken().value_or("");
        }

        modelfetch::CurlHttpClient::Options http_options;
        http_options.user_agent = config.user_agent;
        http_options.connect_timeout = config.connect_timeout;
        http_options.low_speed_time = config.low_speed_time;

        auto store = std::make_shared<modelfetch::FileStateStore>(config.stateDir());
        auto http = std::make_shared<modelfetch::CurlHttpClient>(http_options);
        modelfetch::DownloadManager manager(config, store, http);

        if (options.list) {
            printListing(manager);
            return 0;
        }
        if (options.delete_target) {
            if (!manager.deleteModel(*options.delete_target)) {
                std::cerr << "Not a stored model: " << *options.delete_target << std::endl;
                return 1;
            }
            std::cout << "Deleted " << *options.delete_target << std::endl;
            return 0;
        }
        if (options.link) {
            manager.linkExternalModel(options.link->first, options.link->second);
            std::cout << fmt::format("Linked {} as {}\n", options.link->first, options.link->second);
            return 0;
        }
        if (options.clear) {
            std::cout << fmt::format("Removed {} model(s)\n", manager.clearAllModels());
            return 0;
        }

        modelfetch::ConsoleProgressPanel panel(manager.events(), std::cout);
        modelfetch::LifecycleBridge bridge;
        bridge.attach(manager);

        std::signal(SIGINT, onSignal);
        std::signal(SIGTERM, onSignal);

        if (options.resume) {
            const auto resumed = manager.resumeAllPaused();
            std::cout << fmt::format("Resuming {} paused download(s)\n", resumed);
        }

        int rejected = 0;
        for (const auto& [url, filename] : options.downloads) {
            try {
                manager.downloadModel(url, filename);
            } catch (const modelfetch::AlreadyDownloadingError& ex) {
                std::cerr << ex.what() << " (use --resume)" << std::endl;
                ++rejected;
            } catch (const modelfetch::InvalidArgumentError& ex) {
                std::cerr << ex.what() << std::endl;
                ++rejected;
            }
        }

        manager.events().flush();
        bridge.startMaintenance(std::chrono::seconds(5));
        panel.run(std::chrono::milliseconds(200), []() { return !g_interrupted.load(); });
        bridge.stopMaintenance();

        if (g_interrupted.load()) {
            bridge.enterBackground();
            manager.events().flush();
            panel.render();
            std::cout << "Interrupted; run again with --resume to continue." << std::endl;
            bridge.detach(manager);
            return 130;
        }

        manager.events().flush();
        bridge.detach(manager);

        int failed = rejected;
        for (const auto& event : panel.cache().snapshot()) {
            if (event.status == modelfetch::DownloadStatus::Failed) {
                std::cerr << fmt::format("{}: {}", event.model_name, event.error.value_or("failed")) << std::endl;
                ++failed;
            }
        }
        return failed == 0 ? 0 : 1;
    } catch (const modelfetch::DownloadError& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Fatal error: " << ex.what() << std::endl;
        return 1;
    }
}
