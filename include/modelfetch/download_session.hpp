#pragma once

#include "download_record.hpp"
#include "http_client.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

namespace modelfetch {

enum class StopReason {
    None,
    Pause,
    Cancel,
    Shutdown
};

struct TransferProgress {
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};
    double speed_bps{0.0};
    double eta_seconds{0.0};
    bool restarted{false}; // the server ignored the range and the file was cut back to zero
};

struct SessionResult {
    enum class Kind {
        Completed,
        Stopped,
        Failed
    };

    Kind kind{Kind::Failed};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};
    std::string error;
};

// One transfer into one partial file. Each start() runs a worker thread that
// streams from the given offset until the body ends, an error occurs or a
// stop is requested.
class DownloadSession {
public:
    struct Callbacks {
        std::function<void(DownloadSession&, const TransferProgress&)> on_progress;
        std::function<void(DownloadSession&, const SessionResult&)> on_finished;
    };

    DownloadSession(DownloadId id,
                    std::string filename,
                    std::string url,
                    std::filesystem::path partial_path,
                    HttpClient& http,
                    Callbacks callbacks,
                    std::chrono::milliseconds progress_interval);
    ~DownloadSession();

    DownloadSession(const DownloadSession&) = delete;
    DownloadSession& operator=(const DownloadSession&) = delete;

    // Launches the worker. `known_total` may be 0. Must not be called while running.
    void start(std::uint64_t offset, std::uint64_t known_total, std::map<std::string, std::string> headers);

    // First reason wins; the worker notices at the next chunk boundary.
    void requestStop(StopReason reason) noexcept;

    // Waits for the worker; a no-op when called from the worker itself.
    void join();

    [[nodiscard]] DownloadId id() const noexcept { return id_; }
    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }
    [[nodiscard]] const std::string& url() const noexcept { return url_; }
    [[nodiscard]] const std::filesystem::path& partialPath() const noexcept { return partial_path_; }

    [[nodiscard]] bool isRunning() const noexcept { return running_.load(); }
    [[nodiscard]] StopReason stopReason() const noexcept { return stop_reason_.load(); }
    [[nodiscard]] std::uint64_t bytesWritten() const noexcept { return bytes_written_.load(); }
    [[nodiscard]] std::uint64_t totalBytes() const noexcept { return total_bytes_.load(); }

    // Serializes pause/resume/cancel for this id.
    [[nodiscard]] std::mutex& controlMutex() noexcept { return control_mutex_; }

private:
    void run(std::uint64_t offset, std::uint64_t known_total, HttpRequest request, std::shared_ptr<AbortSignal> abort);

    DownloadId id_;
    std::string filename_;
    std::string url_;
    std::filesystem::path partial_path_;
    HttpClient& http_;
    Callbacks callbacks_;
    std::chrono::milliseconds progress_interval_;

    std::thread worker_;
    std::shared_ptr<AbortSignal> abort_;
    std::atomic<bool> running_{false};
    std::atomic<StopReason> stop_reason_{StopReason::None};
    std::atomic<std::uint64_t> bytes_written_{0};
    std::atomic<std::uint64_t> total_bytes_{0};
    std::mutex control_mutex_;
};

using DownloadSessionPtr = std::shared_ptr<DownloadSession>;

} // namespace modelfetch
