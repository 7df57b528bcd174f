#pragma once

#include "download_record.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace modelfetch {

struct DownloadProgressEvent {
    std::string model_name;
    int progress{0};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0};
    DownloadStatus status{DownloadStatus::Starting};
    DownloadId download_id{0};
    std::optional<std::string> error;
    std::int64_t last_updated{0};
    double speed_bps{0.0};
    double eta_seconds{0.0};
};

[[nodiscard]] DownloadProgressEvent makeProgressEvent(const std::string& filename, const DownloadRecord& record);

// Keeps the newest event per file. An event whose last_updated is not newer
// than the cached one is dropped, whatever order it arrives in.
class ProgressCache {
public:
    bool apply(const DownloadProgressEvent& event);

    [[nodiscard]] std::optional<DownloadProgressEvent> get(const std::string& model_name) const;
    [[nodiscard]] std::vector<DownloadProgressEvent> snapshot() const;
    [[nodiscard]] bool hasActive() const;

    void erase(const std::string& model_name);

private:
    mutable std::mutex mutex_;
    std::map<std::string, DownloadProgressEvent> latest_;
};

} // namespace modelfetch
