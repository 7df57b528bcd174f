#include <gtest/gtest.h>

#include "modelfetch/errors.hpp"
#include "modelfetch/state_journal.hpp"
#include "modelfetch/state_store.hpp"

#include <chrono>

#include <nlohmann/json.hpp>

using namespace modelfetch;
using nlohmann::json;

namespace {

DownloadRecord pausedRecord(DownloadId id) {
    DownloadRecord record;
    record.download_id = id;
    record.url = "https://example.com/model.bin";
    record.status = DownloadStatus::Paused;
    record.bytes_downloaded = 40;
    record.total_bytes = 100;
    record.last_updated = 5000;
    return record;
}

} // namespace

TEST(StateJournal, CommitThenLoadRestoresEverything) {
    MemoryStateStore store;
    {
        StateJournal journal(store);
        const auto id = journal.allocateId();
        journal.records()["model.bin"] = pausedRecord(id);
        ResumableSessionBlob blob;
        blob.url = "https://example.com/model.bin";
        blob.filename = "model.bin";
        blob.offset = 40;
        blob.headers = {{"Accept-Encoding", "identity"}};
        journal.sessions()[id] = blob;
        journal.commit();
    }

    StateJournal journal(store);
    journal.load();
    ASSERT_EQ(journal.records().count("model.bin"), 1u);
    const auto& record = journal.records().at("model.bin");
    EXPECT_EQ(record.download_id, 1u);
    EXPECT_EQ(record.status, DownloadStatus::Paused);
    EXPECT_EQ(record.bytes_downloaded, 40u);
    EXPECT_EQ(record.total_bytes, 100u);

    ASSERT_EQ(journal.sessions().count(1), 1u);
    EXPECT_EQ(journal.sessions().at(1).offset, 40u);
    EXPECT_EQ(journal.sessions().at(1).headers.at("Accept-Encoding"), "identity");
    EXPECT_EQ(journal.peekNextId(), 2u);
}

TEST(StateJournal, DocumentCarriesVersionAndProgress) {
    MemoryStateStore store;
    StateJournal journal(store);
    journal.records()["model.bin"] = pausedRecord(journal.allocateId());
    journal.commit();

    const auto document = json::parse(*store.get(StateJournal::kStateKey));
    EXPECT_EQ(document["version"], StateJournal::kFormatVersion);
    EXPECT_EQ(document["next_download_id"], 2);
    EXPECT_EQ(document["records"]["model.bin"]["progress"], 40);
    EXPECT_EQ(document["records"]["model.bin"]["status"], "paused");
}

TEST(StateJournal, NextIdNeverReusesStoredIds) {
    MemoryStateStore store;
    const json document{{"version", 1},
                        {"next_download_id", 3},
                        {"records",
                         {{"a.bin", {{"download_id", 9}, {"url", "u"}, {"status", "paused"}}}}},
                        {"sessions", json::object()}};
    store.set(StateJournal::kStateKey, document.dump());

    StateJournal journal(store);
    journal.load();
    EXPECT_EQ(journal.peekNextId(), 10u);
}

TEST(StateJournal, InvalidCountsRejectRecord) {
    MemoryStateStore store;
    const json document{
        {"records",
         {{"negative.bin", {{"download_id", 1}, {"url", "u"}, {"status", "paused"}, {"bytes_downloaded", -1}}},
          {"fraction.bin", {{"download_id", 2}, {"url", "u"}, {"status", "paused"}, {"total_bytes", 1.5}}},
          {"text.bin", {{"download_id", 3}, {"url", "u"}, {"status", "paused"}, {"total_bytes", "10"}}},
          {"noid.bin", {{"url", "u"}, {"status", "paused"}}},
          {"good.bin", {{"download_id", 4}, {"url", "u"}, {"status", "paused"}, {"total_bytes", 10.0}}}}}};
    store.set(StateJournal::kStateKey, document.dump());

    StateJournal journal(store);
    journal.load();
    EXPECT_EQ(journal.records().size(), 1u);
    EXPECT_EQ(journal.records().count("good.bin"), 1u);
    EXPECT_EQ(journal.invalidRecords().size(), 4u);
}

TEST(StateJournal, BytesAreClampedToTotal) {
    MemoryStateStore store;
    const json document{
        {"records",
         {{"m.bin",
           {{"download_id", 1}, {"url", "u"}, {"status", "paused"}, {"bytes_downloaded", 900}, {"total_bytes", 500}}}}}};
    store.set(StateJournal::kStateKey, document.dump());

    StateJournal journal(store);
    journal.load();
    EXPECT_EQ(journal.records().at("m.bin").bytes_downloaded, 500u);
}

TEST(StateJournal, InvalidEntriesSurviveCommit) {
    MemoryStateStore store;
    const json broken_session{{"filename", "m.bin"}, {"blob", "not an object"}};
    const json document{{"records", json::object()}, {"sessions", {{"abc", broken_session}}}};
    store.set(StateJournal::kStateKey, document.dump());

    StateJournal journal(store);
    journal.load();
    EXPECT_TRUE(journal.sessions().empty());
    journal.commit();
    EXPECT_EQ(json::parse(*store.get(StateJournal::kStateKey))["sessions"]["abc"], broken_session);

    journal.eraseInvalidSessionsFor("m.bin");
    journal.commit();
    EXPECT_FALSE(json::parse(*store.get(StateJournal::kStateKey))["sessions"].contains("abc"));
}

TEST(StateJournal, UnparsableDocumentIsCopiedAside) {
    MemoryStateStore store;
    store.set(StateJournal::kStateKey, "not json at all");

    StateJournal journal(store);
    journal.load();
    EXPECT_TRUE(journal.records().empty());
    EXPECT_EQ(store.get(StateJournal::kCorruptKey).value_or(""), "not json at all");
}

TEST(StateJournal, StampsStrictlyIncreaseAndFollowStoredValues) {
    MemoryStateStore store;
    const auto far_future = std::chrono::duration_cast<std::chrono::milliseconds>(
                                std::chrono::system_clock::now().time_since_epoch())
                                .count() +
                            3600 * 1000;
    const json document{
        {"records",
         {{"m.bin", {{"download_id", 1}, {"url", "u"}, {"status", "paused"}, {"last_updated", far_future}}}}}};
    store.set(StateJournal::kStateKey, document.dump());

    StateJournal journal(store);
    journal.load();
    auto previous = journal.stamp();
    EXPECT_GT(previous, far_future);
    for (int i = 0; i < 100; ++i) {
        const auto next = journal.stamp();
        EXPECT_GT(next, previous);
        previous = next;
    }
}

TEST(StateJournal, CommitFailurePropagates) {
    MemoryStateStore store;
    StateJournal journal(store);
    store.failWrites(true);
    EXPECT_THROW(journal.commit(), PersistenceError);
}

TEST(StateJournal, UnencodableTextFailsAsPersistenceError) {
    MemoryStateStore store;
    StateJournal journal(store);
    journal.records()["ok.bin"] = pausedRecord(journal.allocateId());
    journal.commit();
    const auto before = store.get(StateJournal::kStateKey);

    auto bad = pausedRecord(journal.allocateId());
    bad.url = "https://example.com/\xff.bin";
    journal.records()["bad.bin"] = bad;
    EXPECT_THROW(journal.commit(), PersistenceError);

    // nothing half-written
    EXPECT_EQ(store.get(StateJournal::kStateKey), before);
}
