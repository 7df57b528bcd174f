#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>

namespace modelfetch {

using DownloadId = std::uint64_t;

enum class DownloadStatus {
    Starting,
    Downloading,
    Paused,
    Completed,
    Failed,
    Unknown // only reported by status queries, never stored
};

[[nodiscard]] const char* toString(DownloadStatus status) noexcept;
[[nodiscard]] std::optional<DownloadStatus> parseStatus(std::string_view text) noexcept;
[[nodiscard]] bool isTerminal(DownloadStatus status) noexcept;

// round(bytes / total * 100), 0 when the total is unknown, never above 100.
[[nodiscard]] int progressPercent(std::uint64_t bytes_downloaded, std::uint64_t total_bytes) noexcept;

struct DownloadRecord {
    DownloadId download_id{0};
    std::string url;
    DownloadStatus status{DownloadStatus::Starting};
    std::uint64_t bytes_downloaded{0};
    std::uint64_t total_bytes{0}; // 0 = unknown
    std::optional<std::string> error;
    std::int64_t last_updated{0};

    [[nodiscard]] int progress() const noexcept { return progressPercent(bytes_downloaded, total_bytes); }
};

// Everything needed to rebuild a stopped transfer as a new range request.
struct ResumableSessionBlob {
    std::string url;
    std::string filename;
    std::uint64_t offset{0};
    std::string method{"GET"};
    std::map<std::string, std::string> headers;
};

struct DownloadStatusReport {
    DownloadStatus status{DownloadStatus::Unknown};
    std::optional<std::uint64_t> bytes_downloaded;
    std::optional<std::uint64_t> total_bytes;
    std::optional<std::string> reason;
};

struct StoredModel {
    std::string name;
    std::string path;
    std::uint64_t size{0};
    std::string modified; // ISO-8601, UTC
    bool is_external{false}; // linked in place, outside base_dir
};

} // namespace modelfetch
