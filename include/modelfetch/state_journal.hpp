#pragma once

#include "download_record.hpp"
#include "state_store.hpp"

#include <cstdint>
#include <map>
#include <string>

namespace modelfetch {

// In-memory image of everything the manager persists. The whole image is one
// document under a single key, so a record and its resumable blob always
// change together.
class StateJournal {
public:
    static constexpr const char* kStateKey = "modelfetch.downloads";
    static constexpr const char* kCorruptKey = "modelfetch.downloads.corrupt";
    static constexpr int kFormatVersion = 1;

    explicit StateJournal(StateStore& store);

    // Replaces the image with what the store holds. A document that cannot
    // be parsed is copied aside and the image starts empty.
    void load();

    // Writes the image back. Throws PersistenceError, also when the image
    // cannot be encoded.
    void commit();

    [[nodiscard]] std::map<std::string, DownloadRecord>& records() noexcept { return records_; }
    [[nodiscard]] const std::map<std::string, DownloadRecord>& records() const noexcept { return records_; }

    [[nodiscard]] std::map<DownloadId, ResumableSessionBlob>& sessions() noexcept { return sessions_; }
    [[nodiscard]] const std::map<DownloadId, ResumableSessionBlob>& sessions() const noexcept { return sessions_; }

    // Entries found in storage that failed validation; written back untouched.
    [[nodiscard]] const std::map<std::string, std::string>& invalidRecords() const noexcept { return invalid_records_; }
    [[nodiscard]] const std::map<std::string, std::string>& invalidSessions() const noexcept { return invalid_sessions_; }

    void eraseInvalidRecord(const std::string& filename);
    void eraseInvalidSessionsFor(const std::string& filename);

    [[nodiscard]] DownloadId allocateId() noexcept { return next_id_++; }
    [[nodiscard]] DownloadId peekNextId() const noexcept { return next_id_; }

    // Strictly increasing millisecond timestamps, never behind the wall clock
    // and never behind anything already stored.
    [[nodiscard]] std::int64_t stamp() noexcept;

    [[nodiscard]] std::string serialize() const;

private:
    StateStore& store_;
    std::map<std::string, DownloadRecord> records_;
    std::map<DownloadId, ResumableSessionBlob> sessions_;
    std::map<std::string, std::string> invalid_records_;
    std::map<std::string, std::string> invalid_sessions_;
    DownloadId next_id_{1};
    std::int64_t last_stamp_{0};
};

} // namespace modelfetch
