#include "modelfetch/download_manager.hpp"

#include "modelfetch/detail/file_utils.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/log.hpp"
#include "modelfetch/progress.hpp"

#include <algorithm>
#include <exception>
#include <utility>

#include <fmt/format.h>

namespace modelfetch {

namespace {

constexpr const char* kCancelledMessage = "Download cancelled by user";

void validateFilename(const std::string& filename) {
    if (filename.empty()) {
        throw InvalidArgumentError("Filename must not be empty");
    }
    if (filename.front() == '.' || filename.find('/') != std::string::npos ||
        filename.find('\\') != std::string::npos) {
        throw InvalidArgumentError(fmt::format("Invalid model filename: {}", filename));
    }
    if (!detail::isValidUtf8(filename)) {
        throw InvalidArgumentError("Model filename is not valid UTF-8");
    }
}

} // namespace

DownloadManager::DownloadManager(ManagerConfig config,
                                 std::shared_ptr<StateStore> store,
                                 std::shared_ptr<HttpClient> http)
    : config_(std::move(config)),
      store_(std::move(store)),
      http_(std::move(http)),
      journal_(*store_),
      registry_(*store_) {
    if (!store_ || !http_) {
        throw InvalidArgumentError("DownloadManager needs a state store and an HTTP client");
    }
    detail::ensureDirectory(config_.base_dir);
    detail::ensureDirectory(config_.tempDir());
    registry_.load();

    reaper_ = std::thread([this]() { reaperLoop(); });

    try {
        resumePendingDownloads();
    } catch (...) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        reaper_cv_.notify_all();
        reaper_.join();
        throw;
    }
}

DownloadManager::~DownloadManager() {
    try {
        saveAllDownloadStates();
    } catch (const std::exception& ex) {
        MODELFETCH_ERROR("Saving download states on shutdown failed: {}", ex.what());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        stopping_ = true;
    }
    reaper_cv_.notify_all();
    if (reaper_.joinable()) {
        reaper_.join();
    }

    std::map<DownloadId, DownloadSessionPtr> remaining;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        remaining.swap(sessions_);
    }
    for (auto& entry : remaining) {
        entry.second->requestStop(StopReason::Shutdown);
    }
    remaining.clear();
    events_.flush();
}

// ---------------------------------------------------------------------------
// Public operations
// ---------------------------------------------------------------------------

DownloadHandle DownloadManager::downloadModel(const std::string& url, const std::string& filename) {
    if (url.empty()) {
        throw InvalidArgumentError("URL must not be empty");
    }
    if (!detail::isValidUtf8(url)) {
        throw InvalidArgumentError("URL is not valid UTF-8");
    }
    validateFilename(filename);

    std::vector<DownloadSessionPtr> doomed;
    std::lock_guard<std::mutex> lock(mutex_);

    auto& records = journal_.records();
    auto existing = records.find(filename);
    if (existing != records.end()) {
        if (!isTerminal(existing->second.status)) {
            throw AlreadyDownloadingError(filename);
        }
        // 宽限期内的终态记录直接让位给新下载
        purgeLocked(filename, existing->second.download_id, doomed);
    }
    if (registry_.findByName(filename)) {
        throw InvalidArgumentError(fmt::format("A linked model is already named {}", filename));
    }
    journal_.eraseInvalidRecord(filename);
    journal_.eraseInvalidSessionsFor(filename);

    const DownloadId id = journal_.allocateId();

    DownloadRecord record;
    record.download_id = id;
    record.url = url;
    record.status = DownloadStatus::Starting;
    record.last_updated = journal_.stamp();

    ResumableSessionBlob blob;
    blob.url = url;
    blob.filename = filename;
    blob.offset = 0;
    blob.headers = {{"Accept-Encoding", "identity"}};

    records[filename] = record;
    journal_.sessions()[id] = blob;
    try {
        journal_.commit();
    } catch (const PersistenceError& ex) {
        MODELFETCH_ERROR("Cannot persist new download {}: {}", filename, ex.what());
        records.erase(filename);
        journal_.sessions().erase(id);
        throw;
    } catch (...) {
        records.erase(filename);
        journal_.sessions().erase(id);
        throw;
    }

    // stale partial data from an earlier attempt
    try {
        detail::removeFile(partialPathFor(filename));
    } catch (const FilesystemError& ex) {
        MODELFETCH_WARN("{}", ex.what());
    }

    publishLocked(filename, record);

    auto session = makeSessionLocked(id, filename, url);
    session->start(0, 0, requestHeaders(blob));

    MODELFETCH_INFO("Download {} started: {} -> {}", id, url, filename);
    return DownloadHandle{id, destinationFor(filename)};
}

void DownloadManager::pauseDownload(DownloadId id) {
    DownloadSessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = sessionLocked(id);
        if (!session) {
            if (filenameForLocked(id)) {
                return; // finished, or paused without resumable data
            }
            throw UnknownDownloadError(fmt::format("Unknown download id {}", id));
        }
    }

    std::lock_guard<std::mutex> control(session->controlMutex());
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!ownsLocked(*session)) {
            return;
        }
        const auto& record = journal_.records().at(session->filename());
        if (record.status == DownloadStatus::Paused || isTerminal(record.status)) {
            return;
        }
        session->requestStop(StopReason::Pause);
    }

    session->join();

    std::lock_guard<std::mutex> lock(mutex_);
    if (!ownsLocked(*session)) {
        return;
    }
    auto& record = journal_.records().at(session->filename());
    if (isTerminal(record.status) || record.status == DownloadStatus::Paused) {
        return;
    }
    settlePausedLocked(*session, record);
    commitOrThrowLocked("pause");
    publishLocked(session->filename(), record);
    MODELFETCH_INFO("Download {} paused at {} bytes", id, record.bytes_downloaded);
}

void DownloadManager::resumeDownload(DownloadId id) {
    DownloadSessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        session = sessionLocked(id);
        if (!session) {
            const auto filename = filenameForLocked(id);
            if (!filename) {
                throw UnknownDownloadError(fmt::format("Unknown download id {}", id));
            }
            if (isTerminal(journal_.records().at(*filename).status)) {
                return;
            }
            throw ResumptionUnavailableError(
                fmt::format("No resumable data for {}; restart the download", *filename));
        }
    }

    std::lock_guard<std::mutex> control(session->controlMutex());
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ownsLocked(*session)) {
        throw UnknownDownloadError(fmt::format("Unknown download id {}", id));
    }

    const auto& filename = session->filename();
    auto& record = journal_.records().at(filename);
    if (isTerminal(record.status) || session->isRunning()) {
        return;
    }

    auto blob_it = journal_.sessions().find(id);
    if (blob_it == journal_.sessions().end()) {
        throw ResumptionUnavailableError(fmt::format("No resumable data for {}; restart the download", filename));
    }
    auto& blob = blob_it->second;

    // 以磁盘上的分片为准
    const auto partial_size = detail::fileSize(session->partialPath());
    if (!partial_size && blob.offset > 0) {
        throw ResumptionUnavailableError(
            fmt::format("Partial data for {} is gone; restart the download", filename));
    }
    std::uint64_t offset = partial_size.value_or(0);
    if (record.total_bytes > 0) {
        offset = std::min(offset, record.total_bytes);
    }

    const auto previous_record = record;
    const auto previous_blob = blob;
    record.status = DownloadStatus::Downloading;
    record.bytes_downloaded = offset;
    record.error.reset();
    record.last_updated = journal_.stamp();
    blob.offset = offset;
    try {
        journal_.commit();
    } catch (const PersistenceError& ex) {
        record = previous_record;
        blob = previous_blob;
        MODELFETCH_ERROR("Cannot persist resume of {}: {}", filename, ex.what());
        throw;
    }

    publishLocked(filename, record);
    session->start(offset, record.total_bytes, requestHeaders(blob));
    MODELFETCH_INFO("Download {} resumed from byte {}", id, offset);
}

bool DownloadManager::cancelDownload(DownloadId id) {
    DownloadSessionPtr session;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto filename = filenameForLocked(id);
        if (!filename || isTerminal(journal_.records().at(*filename).status)) {
            return false;
        }
        session = sessionLocked(id);
    }

    std::unique_lock<std::mutex> control;
    if (session) {
        control = std::unique_lock<std::mutex>(session->controlMutex());
    }

    std::string filename;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto found = filenameForLocked(id);
        if (!found || isTerminal(journal_.records().at(*found).status)) {
            return false;
        }
        filename = *found;
        if (session) {
            session->requestStop(StopReason::Cancel);
        }
    }

    if (session) {
        session->join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto it = journal_.records().find(filename);
    if (it == journal_.records().end() || it->second.download_id != id) {
        return false;
    }
    DownloadRecord record = it->second;

    try {
        detail::removeFile(partialPathFor(filename));
    } catch (const FilesystemError& ex) {
        MODELFETCH_ERROR("Cannot delete partial file of {}: {}", filename, ex.what());
    }

    journal_.records().erase(it);
    journal_.sessions().erase(id);
    journal_.eraseInvalidSessionsFor(filename);
    sessions_.erase(id);
    commitOrThrowLocked("cancel");

    record.status = DownloadStatus::Failed;
    record.error = kCancelledMessage;
    record.last_updated = journal_.stamp();
    publishLocked(filename, record);
    MODELFETCH_INFO("Download {} ({}) cancelled", id, filename);
    return true;
}

DownloadStatusReport DownloadManager::checkDownloadStatus(DownloadId id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    DownloadStatusReport report;
    const auto filename = filenameForLocked(id);
    if (!filename) {
        return report;
    }

    const auto& record = journal_.records().at(*filename);
    report.status = record.status;
    report.bytes_downloaded = record.bytes_downloaded;
    report.total_bytes = record.total_bytes;
    if (record.status == DownloadStatus::Failed) {
        report.reason = record.error;
    } else if (record.status == DownloadStatus::Paused && journal_.sessions().count(id) == 0) {
        report.reason = std::string("Resumption data unavailable");
    }
    return report;
}

std::vector<StoredModel> DownloadManager::getStoredModels() const {
    std::vector<StoredModel> models;
    for (const auto& path : detail::listFiles(config_.base_dir)) {
        StoredModel model;
        model.name = path.filename().string();
        model.path = path.string();
        model.size = detail::fileSize(path).value_or(0);
        model.modified = detail::modifiedTimestamp(path);
        models.push_back(std::move(model));
    }

    std::vector<StoredModel> linked;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        linked = registry_.models();
    }
    for (auto& model : linked) {
        // 外部文件可能已被改动, 能读到就以磁盘为准
        if (const auto size = detail::fileSize(model.path)) {
            model.size = *size;
            model.modified = detail::modifiedTimestamp(model.path);
        }
        models.push_back(std::move(model));
    }
    return models;
}

bool DownloadManager::deleteModel(const std::string& path) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (registry_.findByPath(path)) {
            try {
                registry_.removeByPath(path);
            } catch (const PersistenceError& ex) {
                MODELFETCH_ERROR("Cannot forget linked model {}: {}", path, ex.what());
                return false;
            }
            MODELFETCH_INFO("Removed linked model reference {}", path);
            events_.publishModelsChanged();
            return true;
        }
    }

    std::filesystem::path target{path};
    if (target.is_relative()) {
        target = config_.base_dir / target;
    }

    std::error_code ec;
    const auto parent = std::filesystem::weakly_canonical(target.parent_path(), ec);
    const auto base = std::filesystem::weakly_canonical(config_.base_dir, ec);
    if (ec || parent != base || detail::isWithin(target, config_.stateDir())) {
        MODELFETCH_WARN("Refusing to delete {}: not a stored model", path);
        return false;
    }
    const auto name = target.filename().string();
    if (name.empty() || name.front() == '.' || !detail::fileExists(target)) {
        return false;
    }

    try {
        detail::removeFile(target);
    } catch (const FilesystemError& ex) {
        MODELFETCH_ERROR("{}", ex.what());
        return false;
    }
    MODELFETCH_INFO("Deleted model {}", target.string());
    events_.publishModelsChanged();
    return true;
}

void DownloadManager::linkExternalModel(const std::string& path, const std::string& name) {
    validateFilename(name);
    if (path.empty() || !detail::isValidUtf8(path)) {
        throw InvalidArgumentError("External model path must be non-empty UTF-8");
    }
    const auto size = detail::fileSize(path);
    if (!size) {
        throw InvalidArgumentError(fmt::format("External file does not exist: {}", path));
    }
    if (detail::isWithin(path, config_.base_dir)) {
        throw InvalidArgumentError(fmt::format("{} is already inside the models directory", path));
    }

    StoredModel model;
    model.name = name;
    model.path = path;
    model.size = *size;
    model.modified = detail::modifiedTimestamp(path);

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (detail::fileExists(config_.base_dir / name)) {
            throw InvalidArgumentError(fmt::format("A model named {} already exists in the models directory", name));
        }
        if (registry_.findByName(name)) {
            throw InvalidArgumentError(fmt::format("A linked model is already named {}", name));
        }
        auto record = journal_.records().find(name);
        if (record != journal_.records().end() && !isTerminal(record->second.status)) {
            throw AlreadyDownloadingError(name);
        }
        registry_.add(std::move(model));
    }

    MODELFETCH_INFO("Linked external model {} -> {}", name, path);
    events_.publishModelsChanged();
}

std::size_t DownloadManager::clearAllModels() {
    std::size_t removed = 0;
    for (const auto& path : detail::listFiles(config_.base_dir)) {
        try {
            detail::removeFile(path);
            ++removed;
        } catch (const FilesystemError& ex) {
            MODELFETCH_ERROR("{}", ex.what());
        }
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto linked = registry_.models().size();
        try {
            registry_.clear();
        } catch (const PersistenceError& ex) {
            MODELFETCH_ERROR("Cannot forget linked models: {}", ex.what());
            if (removed > 0) {
                events_.publishModelsChanged();
            }
            throw;
        }
        removed += linked;
    }

    MODELFETCH_INFO("Cleared {} model(s)", removed);
    if (removed > 0) {
        events_.publishModelsChanged();
    }
    return removed;
}

// ---------------------------------------------------------------------------
// Reconciliation
// ---------------------------------------------------------------------------

void DownloadManager::resumePendingDownloads() {
    std::vector<DownloadSessionPtr> doomed;
    std::unique_lock<std::mutex> lock(mutex_);

    // 进程内仍在运行的传输保持原样, 其余内存状态全部以存储为准重建
    std::map<std::string, DownloadRecord> live_records;
    std::map<DownloadId, ResumableSessionBlob> live_blobs;
    std::map<DownloadId, DownloadSessionPtr> live_sessions;
    for (auto& [id, session] : sessions_) {
        if (session->isRunning()) {
            auto record = journal_.records().find(session->filename());
            if (record != journal_.records().end()) {
                live_records[record->first] = record->second;
            }
            auto blob = journal_.sessions().find(id);
            if (blob != journal_.sessions().end()) {
                live_blobs[id] = blob->second;
            }
            live_sessions[id] = session;
        } else {
            doomed.push_back(session);
        }
    }
    sessions_ = std::move(live_sessions);
    purges_.clear();

    journal_.load();
    for (auto& [filename, record] : live_records) {
        journal_.records()[filename] = record;
    }
    for (auto& [id, blob] : live_blobs) {
        journal_.sessions()[id] = blob;
    }

    auto& records = journal_.records();
    auto& blobs = journal_.sessions();

    // blobs whose record went missing still describe a resumable transfer
    for (const auto& [id, blob] : blobs) {
        if (records.count(blob.filename) == 0 && journal_.invalidRecords().count(blob.filename) == 0) {
            DownloadRecord rebuilt;
            rebuilt.download_id = id;
            rebuilt.url = blob.url;
            rebuilt.status = DownloadStatus::Paused;
            rebuilt.bytes_downloaded = blob.offset;
            rebuilt.last_updated = journal_.stamp();
            records[blob.filename] = rebuilt;
            MODELFETCH_WARN("Rebuilt missing record for {} from its resumable data", blob.filename);
        }
    }

    std::vector<std::pair<std::string, DownloadRecord>> events;
    std::vector<std::pair<std::string, DownloadId>> finished;
    for (auto& [filename, record] : records) {
        if (sessions_.count(record.download_id) != 0) {
            events.emplace_back(filename, record);
            continue;
        }

        if (isTerminal(record.status)) {
            events.emplace_back(filename, record);
            finished.emplace_back(filename, record.download_id);
            continue;
        }

        if (record.status != DownloadStatus::Paused) {
            MODELFETCH_INFO("{} was {} when the process stopped, marking paused", filename,
                            toString(record.status));
            record.status = DownloadStatus::Paused;
            record.last_updated = journal_.stamp();
        }

        auto blob = blobs.find(record.download_id);
        if (blob != blobs.end() && blob->second.filename == filename) {
            if (record.total_bytes > 0 && record.bytes_downloaded > record.total_bytes) {
                record.bytes_downloaded = record.total_bytes;
            }
            makeSessionLocked(record.download_id, filename, blob->second.url);
        } else {
            MODELFETCH_WARN("{} has no usable resumable data and cannot be resumed", filename);
        }
        events.emplace_back(filename, record);
    }

    for (const auto& [filename, id] : finished) {
        records.erase(filename);
        blobs.erase(id);
    }

    commitLocked("reconciliation");
    for (const auto& [filename, record] : events) {
        publishLocked(filename, record);
    }

    lock.unlock();
    doomed.clear();
}

void DownloadManager::saveAllDownloadStates() {
    std::vector<DownloadSessionPtr> targets;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            auto record = journal_.records().find(session->filename());
            if (record == journal_.records().end() || record->second.download_id != id) {
                continue;
            }
            const auto status = record->second.status;
            if (status == DownloadStatus::Starting || status == DownloadStatus::Downloading) {
                targets.push_back(session);
            }
        }
    }
    if (targets.empty()) {
        return;
    }

    std::vector<std::unique_lock<std::mutex>> controls;
    controls.reserve(targets.size());
    for (const auto& session : targets) {
        controls.emplace_back(session->controlMutex());
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& session : targets) {
            if (ownsLocked(*session)) {
                session->requestStop(StopReason::Pause);
            }
        }
    }

    // 传输可能已经自行结束, join 直接返回
    for (const auto& session : targets) {
        session->join();
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> saved;
    for (const auto& session : targets) {
        if (!ownsLocked(*session)) {
            continue;
        }
        auto& record = journal_.records().at(session->filename());
        if (isTerminal(record.status) || record.status == DownloadStatus::Paused) {
            continue;
        }
        settlePausedLocked(*session, record);
        saved.push_back(session->filename());
    }
    if (saved.empty()) {
        return;
    }

    commitOrThrowLocked("background save");
    for (const auto& filename : saved) {
        publishLocked(filename, journal_.records().at(filename));
    }
    MODELFETCH_INFO("Saved {} download(s) for background", saved.size());
}

void DownloadManager::checkBackgroundDownloads() {
    std::vector<DownloadSessionPtr> doomed;
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<std::string> completed;
    std::vector<std::string> rewound;
    for (auto& [filename, record] : journal_.records()) {
        if (isTerminal(record.status)) {
            continue;
        }
        auto session = sessions_.find(record.download_id);
        if (session != sessions_.end() && session->second->isRunning()) {
            continue;
        }

        const auto final_path = config_.base_dir / filename;
        const auto partial_path = partialPathFor(filename);
        auto partial_size = detail::fileSize(partial_path);
        const auto final_size = detail::fileSize(final_path);

        // 崩溃留下的空分片不含任何数据
        if (partial_size && *partial_size == 0) {
            try {
                detail::removeFile(partial_path);
                partial_size.reset();
                MODELFETCH_INFO("Removed empty partial file of {}", filename);
                auto blob = journal_.sessions().find(record.download_id);
                if (blob != journal_.sessions().end() && blob->second.offset != 0) {
                    blob->second.offset = 0;
                    record.bytes_downloaded = 0;
                    record.last_updated = journal_.stamp();
                    rewound.push_back(filename);
                }
            } catch (const FilesystemError& ex) {
                MODELFETCH_ERROR("{}", ex.what());
            }
        }

        std::optional<std::uint64_t> size;
        if (partial_size && record.total_bytes > 0 && *partial_size == record.total_bytes) {
            try {
                detail::moveFile(partial_path, final_path);
            } catch (const FilesystemError& ex) {
                MODELFETCH_ERROR("{}", ex.what());
                continue;
            }
            size = partial_size;
        } else if (!partial_size && final_size && *final_size > 0 &&
                   (record.total_bytes == 0 || *final_size == record.total_bytes)) {
            size = final_size;
        }
        if (!size) {
            continue;
        }

        MODELFETCH_INFO("{} finished while in background ({} bytes)", filename, *size);
        record.status = DownloadStatus::Completed;
        record.bytes_downloaded = *size;
        record.total_bytes = *size;
        record.error.reset();
        record.last_updated = journal_.stamp();
        journal_.sessions().erase(record.download_id);
        if (session != sessions_.end()) {
            doomed.push_back(session->second);
            sessions_.erase(session);
        }
        schedulePurgeLocked(filename, record.download_id);
        completed.push_back(filename);
    }

    // 没有记录引用的分片文件
    try {
        for (const auto& path : detail::listFiles(config_.tempDir())) {
            const auto name = path.filename().string();
            auto record = journal_.records().find(name);
            if (record == journal_.records().end() || isTerminal(record->second.status)) {
                MODELFETCH_INFO("Removing orphaned partial file {}", path.string());
                detail::removeFile(path);
            }
        }
    } catch (const FilesystemError& ex) {
        MODELFETCH_ERROR("Temp directory cleanup failed: {}", ex.what());
    }

    if (completed.empty() && rewound.empty()) {
        return;
    }
    const bool committed = commitLocked("background completion");
    for (const auto& filename : rewound) {
        if (committed && std::find(completed.begin(), completed.end(), filename) == completed.end()) {
            publishLocked(filename, journal_.records().at(filename));
        }
    }
    for (const auto& filename : completed) {
        publishLocked(filename, journal_.records().at(filename));
    }
    if (!completed.empty()) {
        events_.publishModelsChanged();
    }
}

std::size_t DownloadManager::resumeAllPaused() {
    std::vector<DownloadId> candidates;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& [filename, record] : journal_.records()) {
            if (record.status == DownloadStatus::Paused && journal_.sessions().count(record.download_id) != 0) {
                candidates.push_back(record.download_id);
            }
        }
    }

    std::size_t resumed = 0;
    for (const auto id : candidates) {
        try {
            resumeDownload(id);
            ++resumed;
        } catch (const ResumptionUnavailableError& ex) {
            MODELFETCH_WARN("{}", ex.what());
        } catch (const UnknownDownloadError& ex) {
            MODELFETCH_WARN("{}", ex.what());
        }
    }
    return resumed;
}

// ---------------------------------------------------------------------------
// Queries
// ---------------------------------------------------------------------------

std::optional<DownloadRecord> DownloadManager::findRecord(const std::string& filename) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = journal_.records().find(filename);
    if (it == journal_.records().end()) {
        return std::nullopt;
    }
    return it->second;
}

std::vector<std::pair<std::string, DownloadRecord>> DownloadManager::records() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return {journal_.records().begin(), journal_.records().end()};
}

std::string DownloadManager::destinationFor(const std::string& filename) const {
    return (config_.base_dir / filename).string();
}

// ---------------------------------------------------------------------------
// Lifecycle hooks
// ---------------------------------------------------------------------------

void DownloadManager::onBackground() { saveAllDownloadStates(); }

void DownloadManager::onForeground() {
    resumePendingDownloads();
    if (config_.resume_on_foreground) {
        const auto resumed = resumeAllPaused();
        MODELFETCH_INFO("Resumed {} download(s) on foreground", resumed);
    }
}

void DownloadManager::onMaintenanceTick() { checkBackgroundDownloads(); }

// ---------------------------------------------------------------------------
// Worker callbacks
// ---------------------------------------------------------------------------

void DownloadManager::handleProgress(DownloadSession& session, const TransferProgress& progress) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (session.stopReason() != StopReason::None || !ownsLocked(session)) {
        return;
    }
    auto& record = journal_.records().at(session.filename());
    if (isTerminal(record.status)) {
        return;
    }

    record.status = DownloadStatus::Downloading;
    record.total_bytes = progress.total_bytes;
    record.bytes_downloaded = progress.bytes_downloaded;
    if (record.total_bytes > 0 && record.bytes_downloaded > record.total_bytes) {
        record.bytes_downloaded = record.total_bytes;
    }
    record.last_updated = journal_.stamp();

    auto blob = journal_.sessions().find(session.id());
    if (blob != journal_.sessions().end()) {
        blob->second.offset = record.bytes_downloaded;
    }

    if (progress.restarted) {
        MODELFETCH_INFO("{} restarted from byte 0", session.filename());
    }
    MODELFETCH_TRACE("{}: {}/{} bytes", session.filename(), record.bytes_downloaded, record.total_bytes);

    // 未落盘的进度不发布, 下一次回调会重试
    if (!commitLocked("progress")) {
        return;
    }
    publishLocked(session.filename(), record, progress.speed_bps, progress.eta_seconds);
}

void DownloadManager::handleFinished(DownloadSession& session, const SessionResult& result) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!ownsLocked(session)) {
        return;
    }
    const auto reason = session.stopReason();
    if (result.kind == SessionResult::Kind::Stopped || reason == StopReason::Cancel) {
        return; // pause, cancel and shutdown settle the record themselves
    }

    const auto& filename = session.filename();
    auto& record = journal_.records().at(filename);
    if (isTerminal(record.status)) {
        return;
    }

    if (result.kind == SessionResult::Kind::Failed) {
        MODELFETCH_ERROR("Download {} ({}) failed: {}", session.id(), filename, result.error);
        failLocked(filename, record, result.error);
        return;
    }

    const auto size = detail::fileSize(session.partialPath());
    if (!size) {
        failLocked(filename, record, "Downloaded file not found");
        return;
    }
    if (result.total_bytes > 0 && *size != result.total_bytes) {
        failLocked(filename, record,
                   fmt::format("Downloaded size {} does not match expected {}", *size, result.total_bytes));
        return;
    }

    try {
        detail::moveFile(session.partialPath(), config_.base_dir / filename);
    } catch (const FilesystemError& ex) {
        failLocked(filename, record, ex.what());
        return;
    }
    completeLocked(filename, record, *size);
    MODELFETCH_INFO("Download {} ({}) completed, {} bytes", session.id(), filename, *size);
}

// ---------------------------------------------------------------------------
// Internals (mutex_ held)
// ---------------------------------------------------------------------------

DownloadSessionPtr DownloadManager::makeSessionLocked(DownloadId id,
                                                      const std::string& filename,
                                                      const std::string& url) {
    DownloadSession::Callbacks callbacks;
    callbacks.on_progress = [this](DownloadSession& session, const TransferProgress& progress) {
        handleProgress(session, progress);
    };
    callbacks.on_finished = [this](DownloadSession& session, const SessionResult& result) {
        handleFinished(session, result);
    };

    auto session = std::make_shared<DownloadSession>(id, filename, url, partialPathFor(filename), *http_,
                                                     std::move(callbacks), config_.progress_interval);
    sessions_[id] = session;
    return session;
}

DownloadSessionPtr DownloadManager::sessionLocked(DownloadId id) const {
    auto it = sessions_.find(id);
    return it == sessions_.end() ? nullptr : it->second;
}

std::optional<std::string> DownloadManager::filenameForLocked(DownloadId id) const {
    for (const auto& [filename, record] : journal_.records()) {
        if (record.download_id == id) {
            return filename;
        }
    }
    return std::nullopt;
}

bool DownloadManager::ownsLocked(const DownloadSession& session) const {
    auto it = sessions_.find(session.id());
    if (it == sessions_.end() || it->second.get() != &session) {
        return false;
    }
    auto record = journal_.records().find(session.filename());
    return record != journal_.records().end() && record->second.download_id == session.id();
}

std::map<std::string, std::string> DownloadManager::requestHeaders(const ResumableSessionBlob& blob) const {
    auto headers = blob.headers;
    if (!config_.auth_token.empty()) {
        headers["Authorization"] = "Bearer " + config_.auth_token;
    }
    return headers;
}

std::filesystem::path DownloadManager::partialPathFor(const std::string& filename) const {
    return config_.tempDir() / filename;
}

void DownloadManager::completeLocked(const std::string& filename, DownloadRecord& record, std::uint64_t size) {
    record.status = DownloadStatus::Completed;
    record.bytes_downloaded = size;
    record.total_bytes = size;
    record.error.reset();
    record.last_updated = journal_.stamp();
    journal_.sessions().erase(record.download_id);

    commitLocked("completion");
    publishLocked(filename, record);
    events_.publishModelsChanged();
    schedulePurgeLocked(filename, record.download_id);
}

void DownloadManager::failLocked(const std::string& filename, DownloadRecord& record, const std::string& error) {
    record.status = DownloadStatus::Failed;
    record.error = error;
    record.last_updated = journal_.stamp();
    journal_.sessions().erase(record.download_id);

    try {
        detail::removeFile(partialPathFor(filename));
    } catch (const FilesystemError& ex) {
        MODELFETCH_ERROR("Cannot delete partial file of {}: {}", filename, ex.what());
    }

    commitLocked("failure");
    publishLocked(filename, record);
    schedulePurgeLocked(filename, record.download_id);
}

void DownloadManager::settlePausedLocked(DownloadSession& session, DownloadRecord& record) {
    std::uint64_t offset = session.bytesWritten();
    const auto on_disk = detail::fileSize(session.partialPath()).value_or(0);
    offset = std::min(offset, on_disk);

    const auto total = session.totalBytes() > 0 ? session.totalBytes() : record.total_bytes;
    if (total > 0) {
        offset = std::min(offset, total);
    }

    record.status = DownloadStatus::Paused;
    record.bytes_downloaded = offset;
    record.total_bytes = total;
    record.error.reset();
    record.last_updated = journal_.stamp();

    auto& blob = journal_.sessions()[session.id()];
    if (blob.url.empty()) {
        blob.url = session.url();
        blob.filename = session.filename();
        blob.headers = {{"Accept-Encoding", "identity"}};
    }
    blob.offset = offset;
}

bool DownloadManager::commitLocked(const char* action) {
    try {
        journal_.commit();
        return true;
    } catch (const PersistenceError& ex) {
        MODELFETCH_ERROR("Persisting {} failed: {}", action, ex.what());
        return false;
    }
}

void DownloadManager::commitOrThrowLocked(const char* action) {
    try {
        journal_.commit();
    } catch (const PersistenceError& ex) {
        MODELFETCH_ERROR("Persisting {} failed: {}", action, ex.what());
        throw;
    }
}

void DownloadManager::publishLocked(const std::string& filename,
                                    const DownloadRecord& record,
                                    double speed_bps,
                                    double eta_seconds) {
    auto event = makeProgressEvent(filename, record);
    event.speed_bps = speed_bps;
    event.eta_seconds = eta_seconds;
    events_.publish(std::move(event));
}

void DownloadManager::schedulePurgeLocked(const std::string& filename, DownloadId id) {
    purges_.push_back(PendingPurge{Clock::now() + config_.grace_delay, filename, id});
    reaper_cv_.notify_all();
}

void DownloadManager::purgeLocked(const std::string& filename,
                                  DownloadId id,
                                  std::vector<DownloadSessionPtr>& doomed) {
    auto it = journal_.records().find(filename);
    if (it == journal_.records().end() || it->second.download_id != id || !isTerminal(it->second.status)) {
        return;
    }
    journal_.records().erase(it);
    journal_.sessions().erase(id);

    auto session = sessions_.find(id);
    if (session != sessions_.end()) {
        doomed.push_back(std::move(session->second));
        sessions_.erase(session);
    }
    commitLocked("purge");
}

void DownloadManager::reaperLoop() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (true) {
        if (stopping_) {
            break;
        }
        if (purges_.empty()) {
            reaper_cv_.wait(lock, [this] { return stopping_ || !purges_.empty(); });
            continue;
        }

        const auto next = std::min_element(purges_.begin(), purges_.end(),
                                           [](const PendingPurge& a, const PendingPurge& b) {
                                               return a.due < b.due;
                                           })->due;
        if (reaper_cv_.wait_until(lock, next, [this, next] {
                return stopping_ || std::any_of(purges_.begin(), purges_.end(),
                                                [next](const PendingPurge& p) { return p.due < next; });
            })) {
            continue;
        }

        std::vector<DownloadSessionPtr> doomed;
        const auto now = Clock::now();
        for (auto it = purges_.begin(); it != purges_.end();) {
            if (it->due <= now) {
                purgeLocked(it->filename, it->id, doomed);
                it = purges_.erase(it);
            } else {
                ++it;
            }
        }

        // 会话析构要 join 工作线程, 不能持锁
        lock.unlock();
        doomed.clear();
        lock.lock();
    }

    // 退出前把到期与未到期的终态记录一并清掉
    std::vector<DownloadSessionPtr> doomed;
    for (const auto& purge : purges_) {
        purgeLocked(purge.filename, purge.id, doomed);
    }
    purges_.clear();
    lock.unlock();
    doomed.clear();
}

} // namespace modelfetch
