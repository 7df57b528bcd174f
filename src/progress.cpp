#include "modelfetch/progress.hpp"

namespace modelfetch {

DownloadProgressEvent makeProgressEvent(const std::string& filename, const DownloadRecord& record) {
    DownloadProgressEvent event;
    event.model_name = filename;
    event.progress = record.progress();
    event.bytes_downloaded = record.bytes_downloaded;
    event.total_bytes = record.total_bytes;
    event.status = record.status;
    event.download_id = record.download_id;
    event.error = record.error;
    event.last_updated = record.last_updated;
    return event;
}

bool ProgressCache::apply(const DownloadProgressEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_.find(event.model_name);
    if (it != latest_.end() && event.last_updated <= it->second.last_updated) {
        return false;
    }
    latest_[event.model_name] = event;
    return true;
}

std::optional<DownloadProgressEvent> ProgressCache::get(const std::string& model_name) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = latest_.find(model_name);
    if (it == latest_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<DownloadProgressEvent> ProgressCache::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<DownloadProgressEvent> events;
    events.reserve(latest_.size());
    for (const auto& entry : latest_) {
        events.push_back(entry.second);
    }
    return events;
}

bool ProgressCache::hasActive() const {
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& entry : latest_) {
        const auto status = entry.second.status;
        if (status == DownloadStatus::Starting || status == DownloadStatus::Downloading) {
            return true;
        }
    }
    return false;
}

void ProgressCache::erase(const std::string& model_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    latest_.erase(model_name);
}

} // namespace modelfetch
