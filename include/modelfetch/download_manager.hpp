#pragma once

#include "config.hpp"
#include "download_record.hpp"
#include "download_session.hpp"
#include "event_bus.hpp"
#include "http_client.hpp"
#include "lifecycle_bridge.hpp"
#include "model_registry.hpp"
#include "state_journal.hpp"
#include "state_store.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace modelfetch {

struct DownloadHandle {
    DownloadId download_id{0};
    std::string path;
};

// Owns every download of one process: assigns ids, drives the per-download
// state machine, is the only writer of the state store and publishes every
// change on events() after it has been persisted.
class DownloadManager final : public LifecycleObserver {
public:
    DownloadManager(ManagerConfig config, std::shared_ptr<StateStore> store, std::shared_ptr<HttpClient> http);
    ~DownloadManager() override;

    DownloadManager(const DownloadManager&) = delete;
    DownloadManager& operator=(const DownloadManager&) = delete;

    // Persists a `starting` record before returning, then transfers in the background.
    // Throws InvalidArgumentError, AlreadyDownloadingError or PersistenceError.
    DownloadHandle downloadModel(const std::string& url, const std::string& filename);

    // No-op for paused or finished downloads. Throws UnknownDownloadError.
    void pauseDownload(DownloadId id);

    // Throws UnknownDownloadError, or ResumptionUnavailableError when the
    // download has to be restarted from scratch.
    void resumeDownload(DownloadId id);

    // false when nothing with this id is in flight.
    bool cancelDownload(DownloadId id);

    [[nodiscard]] DownloadStatusReport checkDownloadStatus(DownloadId id) const;
    // Downloaded models first, then linked ones.
    [[nodiscard]] std::vector<StoredModel> getStoredModels() const;
    // A linked model only loses its list entry; its file stays where it is.
    bool deleteModel(const std::string& path);

    // Lists the file at `path` under `name` without copying it.
    // Throws InvalidArgumentError, AlreadyDownloadingError or PersistenceError.
    void linkExternalModel(const std::string& path, const std::string& name);
    // Deletes every downloaded model and forgets every linked one. Returns how
    // many models went away. Throws PersistenceError.
    std::size_t clearAllModels();

    // Rebuilds the in-memory view from the store; interrupted downloads become paused.
    void resumePendingDownloads();
    // Pauses every running transfer and persists its resumable blob.
    void saveAllDownloadStates();
    // Completes downloads whose bytes landed while the process was not watching.
    void checkBackgroundDownloads();
    // Returns how many paused downloads were restarted.
    std::size_t resumeAllPaused();

    [[nodiscard]] std::optional<DownloadRecord> findRecord(const std::string& filename) const;
    [[nodiscard]] std::vector<std::pair<std::string, DownloadRecord>> records() const;
    [[nodiscard]] std::string destinationFor(const std::string& filename) const;

    [[nodiscard]] ProgressEventBus& events() noexcept { return events_; }
    [[nodiscard]] const ManagerConfig& config() const noexcept { return config_; }

    void onBackground() override;
    void onForeground() override;
    void onMaintenanceTick() override;

private:
    using Clock = std::chrono::steady_clock;

    struct PendingPurge {
        Clock::time_point due;
        std::string filename;
        DownloadId id{0};
    };

    DownloadSessionPtr makeSessionLocked(DownloadId id, const std::string& filename, const std::string& url);
    [[nodiscard]] DownloadSessionPtr sessionLocked(DownloadId id) const;
    [[nodiscard]] std::optional<std::string> filenameForLocked(DownloadId id) const;
    [[nodiscard]] bool ownsLocked(const DownloadSession& session) const;
    [[nodiscard]] std::map<std::string, std::string> requestHeaders(const ResumableSessionBlob& blob) const;
    [[nodiscard]] std::filesystem::path partialPathFor(const std::string& filename) const;

    void handleProgress(DownloadSession& session, const TransferProgress& progress);
    void handleFinished(DownloadSession& session, const SessionResult& result);

    void completeLocked(const std::string& filename, DownloadRecord& record, std::uint64_t size);
    void failLocked(const std::string& filename, DownloadRecord& record, const std::string& error);
    void settlePausedLocked(DownloadSession& session, DownloadRecord& record);

    bool commitLocked(const char* action);
    void commitOrThrowLocked(const char* action);
    void publishLocked(const std::string& filename, const DownloadRecord& record, double speed_bps = 0.0,
                       double eta_seconds = 0.0);

    void schedulePurgeLocked(const std::string& filename, DownloadId id);
    void purgeLocked(const std::string& filename, DownloadId id, std::vector<DownloadSessionPtr>& doomed);
    void reaperLoop();

    ManagerConfig config_;
    ProgressEventBus events_;
    std::shared_ptr<StateStore> store_;
    std::shared_ptr<HttpClient> http_;

    mutable std::mutex mutex_;
    StateJournal journal_;
    ExternalModelRegistry registry_;
    std::map<DownloadId, DownloadSessionPtr> sessions_;

    std::vector<PendingPurge> purges_;
    std::condition_variable reaper_cv_;
    bool stopping_{false};
    std::thread reaper_;
};

} // namespace modelfetch
