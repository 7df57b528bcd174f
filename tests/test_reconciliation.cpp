#include <gtest/gtest.h>

#include "modelfetch/download_manager.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/state_journal.hpp"
#include "modelfetch/state_store.hpp"
#include "support/event_recorder.hpp"
#include "support/fake_http_client.hpp"
#include "support/test_helpers.hpp"

#include <chrono>
#include <memory>
#include <string>

#include <nlohmann/json.hpp>

using namespace modelfetch;
using namespace modelfetch::test_support;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

constexpr const char* kUrl = "https://models.example.com/tiny.gguf";

json recordJson(DownloadId id, const std::string& status, std::uint64_t bytes, std::uint64_t total) {
    return json{{"download_id", id},
                {"url", kUrl},
                {"status", status},
                {"bytes_downloaded", bytes},
                {"total_bytes", total},
                {"last_updated", 1000}};
}

json blobJson(const std::string& filename, std::uint64_t offset, const std::string& url = kUrl) {
    return json{{"url", url},
                {"filename", filename},
                {"blob", {{"offset", offset}, {"method", "GET"}, {"headers", {{"Accept-Encoding", "identity"}}}}}};
}

class ReconciliationTest : public ::testing::Test {
protected:
    void SetUp() override {
        config_.base_dir = dir_.path() / "models";
        config_.grace_delay = 500ms;
        config_.progress_interval = 0ms;
    }

    std::unique_ptr<DownloadManager> makeManager() {
        return std::make_unique<DownloadManager>(config_, store_, http_);
    }

    void seed(const json& records, const json& sessions, DownloadId next_id = 1) {
        const json document{{"version", 1}, {"next_download_id", next_id}, {"records", records}, {"sessions", sessions}};
        store_->set(StateJournal::kStateKey, document.dump());
    }

    json storedDocument() { return json::parse(store_->get(StateJournal::kStateKey).value_or("{}")); }

    std::filesystem::path partialPath(const std::string& filename) const { return config_.tempDir() / filename; }
    std::filesystem::path finalPath(const std::string& filename) const { return config_.base_dir / filename; }

    TempDir dir_;
    ManagerConfig config_;
    std::shared_ptr<FakeHttpClient> http_ = std::make_shared<FakeHttpClient>();
    std::shared_ptr<MemoryStateStore> store_ = std::make_shared<MemoryStateStore>();
};

} // namespace

// =============================================================================
// Restart
// =============================================================================

TEST_F(ReconciliationTest, InterruptedDownloadComesBackPaused) {
    const auto body = makeBody(6000);
    http_->serve(kUrl, body);
    writeFile(partialPath("tiny.gguf"), body.substr(0, 3000));
    seed({{"tiny.gguf", recordJson(7, "downloading", 2500, 6000)}}, {{"7", blobJson("tiny.gguf", 2500)}}, 8);

    auto manager = makeManager();
    const auto report = manager->checkDownloadStatus(7);
    EXPECT_EQ(report.status, DownloadStatus::Paused);
    EXPECT_EQ(report.bytes_downloaded.value_or(0), 2500u);
    EXPECT_EQ(storedDocument()["records"]["tiny.gguf"]["status"], "paused");

    EventRecorder recorder(manager->events());
    manager->resumeDownload(7);
    ASSERT_TRUE(recorder.waitFor("tiny.gguf", DownloadStatus::Completed));

    // the partial file on disk wins over the stored offset
    const auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].url, kUrl);
    EXPECT_EQ(requests[0].range_start, 3000u);
    EXPECT_EQ(readFile(finalPath("tiny.gguf")), body);
}

TEST_F(ReconciliationTest, ResumeUsesUrlFromResumableData) {
    const std::string mirror = "https://mirror.example.com/tiny.gguf";
    http_->serve(mirror, makeBody(2048));
    writeFile(partialPath("tiny.gguf"), makeBody(2048).substr(0, 1024));
    seed({{"tiny.gguf", recordJson(3, "paused", 1024, 2048)}}, {{"3", blobJson("tiny.gguf", 1024, mirror)}}, 4);

    auto manager = makeManager();
    EventRecorder recorder(manager->events());
    manager->resumeDownload(3);
    ASSERT_TRUE(recorder.waitFor("tiny.gguf", DownloadStatus::Completed));
    EXPECT_EQ(http_->requests().at(0).url, mirror);
}

TEST_F(ReconciliationTest, DownloadWithoutResumableDataCannotResume) {
    seed({{"tiny.gguf", recordJson(5, "starting", 0, 0)}}, json::object(), 6);

    auto manager = makeManager();
    const auto report = manager->checkDownloadStatus(5);
    EXPECT_EQ(report.status, DownloadStatus::Paused);
    EXPECT_EQ(report.reason.value_or(""), "Resumption data unavailable");
    EXPECT_THROW(manager->resumeDownload(5), ResumptionUnavailableError);
    EXPECT_TRUE(manager->cancelDownload(5));
}

TEST_F(ReconciliationTest, PausedDownloadSurvivesRestart) {
    FakeHttpClient::Resource resource;
    resource.body = makeBody(8192);
    resource.hold_at = 4096;
    http_->serve(kUrl, resource);

    DownloadId id = 0;
    {
        auto manager = makeManager();
        id = manager->downloadModel(kUrl, "tiny.gguf").download_id;
        ASSERT_TRUE(http_->waitUntilHeld(kUrl));
        // shutting down pauses the transfer and keeps its blob
    }
    http_->release(kUrl);

    auto manager = makeManager();
    const auto report = manager->checkDownloadStatus(id);
    EXPECT_EQ(report.status, DownloadStatus::Paused);
    EXPECT_EQ(report.bytes_downloaded.value_or(0), 4096u);

    EventRecorder recorder(manager->events());
    manager->resumeDownload(id);
    ASSERT_TRUE(recorder.waitFor("tiny.gguf", DownloadStatus::Completed));
    EXPECT_EQ(readFile(finalPath("tiny.gguf")), makeBody(8192));

    // ids keep counting after a restart
    http_->serve("https://models.example.com/next.bin", makeBody(10));
    EXPECT_GT(manager->downloadModel("https://models.example.com/next.bin", "next.bin").download_id, id);
}

TEST_F(ReconciliationTest, StoredIdCounterIsHonoured) {
    seed(json::object(), json::object(), 41);
    http_->serve(kUrl, makeBody(10));
    auto manager = makeManager();
    EXPECT_EQ(manager->downloadModel(kUrl, "tiny.gguf").download_id, 41u);
}

TEST_F(ReconciliationTest, FinishedRecordsAreDroppedOnStartup) {
    auto completed = recordJson(2, "completed", 10, 10);
    auto failed = recordJson(3, "failed", 0, 0);
    failed["error"] = "boom";
    seed({{"done.bin", completed}, {"broken.bin", failed}}, json::object(), 4);

    auto manager = makeManager();
    EXPECT_FALSE(manager->findRecord("done.bin").has_value());
    EXPECT_FALSE(manager->findRecord("broken.bin").has_value());
    EXPECT_TRUE(storedDocument()["records"].empty());
}

TEST_F(ReconciliationTest, RecordIsRebuiltFromOrphanBlob) {
    writeFile(partialPath("tiny.gguf"), makeBody(100));
    seed(json::object(), {{"9", blobJson("tiny.gguf", 100)}}, 10);

    auto manager = makeManager();
    const auto record = manager->findRecord("tiny.gguf");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->download_id, 9u);
    EXPECT_EQ(record->status, DownloadStatus::Paused);
    EXPECT_EQ(record->bytes_downloaded, 100u);
}

// =============================================================================
// Damaged state
// =============================================================================

TEST_F(ReconciliationTest, UnreadableStateIsSetAside) {
    store_->set(StateJournal::kStateKey, "{\"records\": [truncated");

    auto manager = makeManager();
    EXPECT_TRUE(manager->records().empty());
    EXPECT_EQ(store_->get(StateJournal::kCorruptKey).value_or(""), "{\"records\": [truncated");
}

TEST_F(ReconciliationTest, MalformedEntriesAreKeptButIgnored) {
    json bad_record{{"download_id", 4}, {"url", kUrl}, {"status", "exploded"}};
    json bad_blob{{"url", kUrl}, {"filename", "other.bin"}, {"blob", {{"offset", -5}}}};
    seed({{"weird.bin", bad_record}, {"tiny.gguf", recordJson(6, "paused", 0, 0)}},
         {{"11", bad_blob}, {"6", blobJson("tiny.gguf", 0)}}, 12);

    auto manager = makeManager();
    EXPECT_FALSE(manager->findRecord("weird.bin").has_value());
    EXPECT_FALSE(manager->findRecord("other.bin").has_value());
    EXPECT_TRUE(manager->findRecord("tiny.gguf").has_value());

    const auto document = storedDocument();
    EXPECT_EQ(document["records"]["weird.bin"], bad_record);
    EXPECT_EQ(document["sessions"]["11"], bad_blob);
}

// =============================================================================
// Background completion
// =============================================================================

TEST_F(ReconciliationTest, CompletePartialFileIsFinishedByMaintenance) {
    writeFile(partialPath("tiny.gguf"), makeBody(500));
    seed({{"tiny.gguf", recordJson(2, "paused", 250, 500)}}, {{"2", blobJson("tiny.gguf", 250)}}, 3);

    auto manager = makeManager();
    EventRecorder recorder(manager->events());
    manager->checkBackgroundDownloads();

    ASSERT_TRUE(recorder.waitFor("tiny.gguf", DownloadStatus::Completed));
    EXPECT_EQ(readFile(finalPath("tiny.gguf")), makeBody(500));
    EXPECT_FALSE(std::filesystem::exists(partialPath("tiny.gguf")));
    EXPECT_FALSE(storedDocument()["sessions"].contains("2"));
}

TEST_F(ReconciliationTest, FinalFileWithoutPartialIsCompleted) {
    writeFile(finalPath("tiny.gguf"), makeBody(500));
    seed({{"tiny.gguf", recordJson(2, "downloading", 400, 500)}}, {{"2", blobJson("tiny.gguf", 400)}}, 3);

    auto manager = makeManager();
    manager->onMaintenanceTick();
    const auto record = manager->findRecord("tiny.gguf");
    ASSERT_TRUE(record.has_value());
    EXPECT_EQ(record->status, DownloadStatus::Completed);
    EXPECT_EQ(record->bytes_downloaded, 500u);
}

TEST_F(ReconciliationTest, IncompletePartialStaysPaused) {
    writeFile(partialPath("tiny.gguf"), makeBody(200));
    seed({{"tiny.gguf", recordJson(2, "paused", 200, 500)}}, {{"2", blobJson("tiny.gguf", 200)}}, 3);

    auto manager = makeManager();
    manager->checkBackgroundDownloads();
    EXPECT_EQ(manager->checkDownloadStatus(2).status, DownloadStatus::Paused);
    EXPECT_TRUE(std::filesystem::exists(partialPath("tiny.gguf")));
}

TEST_F(ReconciliationTest, OrphanedPartialFilesAreRemoved) {
    writeFile(partialPath("stray.bin"), "left over");
    writeFile(partialPath("tiny.gguf"), makeBody(200));
    seed({{"tiny.gguf", recordJson(2, "paused", 200, 500)}}, {{"2", blobJson("tiny.gguf", 200)}}, 3);

    auto manager = makeManager();
    manager->checkBackgroundDownloads();
    EXPECT_FALSE(std::filesystem::exists(partialPath("stray.bin")));
    EXPECT_TRUE(std::filesystem::exists(partialPath("tiny.gguf")));
}

TEST_F(ReconciliationTest, EmptyPartialDoesNotBlockFinalFile) {
    writeFile(partialPath("tiny.gguf"), "");
    writeFile(finalPath("tiny.gguf"), makeBody(500));
    seed({{"tiny.gguf", recordJson(2, "downloading", 400, 500)}}, {{"2", blobJson("tiny.gguf", 400)}}, 3);

    auto manager = makeManager();
    manager->checkBackgroundDownloads();
    EXPECT_EQ(manager->findRecord("tiny.gguf")->status, DownloadStatus::Completed);
    EXPECT_FALSE(std::filesystem::exists(partialPath("tiny.gguf")));
}

TEST_F(ReconciliationTest, EmptyPartialRewindsToZero) {
    const auto body = makeBody(3000);
    http_->serve(kUrl, body);
    writeFile(partialPath("tiny.gguf"), "");
    seed({{"tiny.gguf", recordJson(2, "paused", 300, 3000)}}, {{"2", blobJson("tiny.gguf", 300)}}, 3);

    auto manager = makeManager();
    manager->checkBackgroundDownloads();
    EXPECT_FALSE(std::filesystem::exists(partialPath("tiny.gguf")));
    EXPECT_EQ(manager->findRecord("tiny.gguf")->bytes_downloaded, 0u);
    EXPECT_EQ(storedDocument()["sessions"]["2"]["blob"]["offset"].get<std::uint64_t>(), 0u);

    EventRecorder recorder(manager->events());
    manager->resumeDownload(2);
    ASSERT_TRUE(recorder.waitFor("tiny.gguf", DownloadStatus::Completed));
    EXPECT_EQ(http_->requests().at(0).range_start, 0u);
    EXPECT_EQ(readFile(finalPath("tiny.gguf")), body);
}

TEST_F(ReconciliationTest, ResumeAtKnownEndCompletesOnRangeNotSatisfiable) {
    const auto body = makeBody(500);
    http_->serve(kUrl, body);
    writeFile(partialPath("tiny.gguf"), body);
    seed({{"tiny.gguf", recordJson(2, "paused", 250, 500)}}, {{"2", blobJson("tiny.gguf", 250)}}, 3);

    auto manager = makeManager();
    EventRecorder recorder(manager->events());
    manager->resumeDownload(2);
    ASSERT_TRUE(recorder.waitFor("tiny.gguf", DownloadStatus::Completed));

    // the server answered 416 to a range starting at the known end
    const auto requests = http_->requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].range_start, 500u);
    EXPECT_EQ(readFile(finalPath("tiny.gguf")), body);
    for (const auto& event : recorder.eventsFor("tiny.gguf")) {
        EXPECT_NE(event.status, DownloadStatus::Failed);
    }
}
