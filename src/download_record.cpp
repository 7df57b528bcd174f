#include "modelfetch/download_record.hpp"

#include <cmath>

namespace modelfetch {

const char* toString(DownloadStatus status) noexcept {
    switch (status) {
    case DownloadStatus::Starting:
        return "starting";
    case DownloadStatus::Downloading:
        return "downloading";
    case DownloadStatus::Paused:
        return "paused";
    case DownloadStatus::Completed:
        return "completed";
    case DownloadStatus::Failed:
        return "failed";
    case DownloadStatus::Unknown:
        break;
    }
    return "unknown";
}

std::optional<DownloadStatus> parseStatus(std::string_view text) noexcept {
    if (text == "starting") {
        return DownloadStatus::Starting;
    }
    if (text == "downloading") {
        return DownloadStatus::Downloading;
    }
    if (text == "paused") {
        return DownloadStatus::Paused;
    }
    if (text == "completed") {
        return DownloadStatus::Completed;
    }
    if (text == "failed") {
        return DownloadStatus::Failed;
    }
    return std::nullopt;
}

bool isTerminal(DownloadStatus status) noexcept {
    return status == DownloadStatus::Completed || status == DownloadStatus::Failed;
}

int progressPercent(std::uint64_t bytes_downloaded, std::uint64_t total_bytes) noexcept {
    if (total_bytes == 0) {
        return 0;
    }
    if (bytes_downloaded >= total_bytes) {
        return 100;
    }
    const double ratio = static_cast<double>(bytes_downloaded) / static_cast<double>(total_bytes);
    const auto percent = static_cast<int>(std::lround(ratio * 100.0));
    return percent > 100 ? 100 : percent;
}

} // namespace modelfetch
