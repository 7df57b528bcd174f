#include "modelfetch/state_journal.hpp"

#include "modelfetch/errors.hpp"
#include "modelfetch/log.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <iterator>
#include <limits>
#include <optional>

#include <nlohmann/json.hpp>

namespace modelfetch {

namespace {

using nlohmann::json;

std::optional<std::uint64_t> readCount(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end()) {
        return std::nullopt;
    }
    if (it->is_number_unsigned()) {
        return it->get<std::uint64_t>();
    }
    if (it->is_number_integer()) {
        const auto value = it->get<std::int64_t>();
        if (value < 0) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(value);
    }
    if (it->is_number_float()) {
        const double value = it->get<double>();
        if (!std::isfinite(value) || value < 0.0 || std::floor(value) != value ||
            value > static_cast<double>(std::numeric_limits<std::int64_t>::max())) {
            return std::nullopt;
        }
        return static_cast<std::uint64_t>(value);
    }
    return std::nullopt;
}

std::optional<std::string> readString(const json& object, const char* key) {
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

json recordToJson(const DownloadRecord& record) {
    json out{
        {"download_id", record.download_id},
        {"url", record.url},
        {"status", toString(record.status)},
        {"bytes_downloaded", record.bytes_downloaded},
        {"total_bytes", record.total_bytes},
        {"progress", record.progress()},
        {"last_updated", record.last_updated},
    };
    if (record.error) {
        out["error"] = *record.error;
    }
    return out;
}

std::optional<DownloadRecord> recordFromJson(const json& in) {
    if (!in.is_object()) {
        return std::nullopt;
    }

    DownloadRecord record;
    const auto id = readCount(in, "download_id");
    const auto url = readString(in, "url");
    const auto status_text = readString(in, "status");
    if (!id || *id == 0 || !url || !status_text) {
        return std::nullopt;
    }
    const auto status = parseStatus(*status_text);
    if (!status) {
        return std::nullopt;
    }

    record.download_id = *id;
    record.url = *url;
    record.status = *status;

    // 缺失的计数按 0 处理, 非法的计数使整条记录失效
    if (in.contains("bytes_downloaded")) {
        const auto bytes = readCount(in, "bytes_downloaded");
        if (!bytes) {
            return std::nullopt;
        }
        record.bytes_downloaded = *bytes;
    }
    if (in.contains("total_bytes")) {
        const auto total = readCount(in, "total_bytes");
        if (!total) {
            return std::nullopt;
        }
        record.total_bytes = *total;
    }
    if (record.total_bytes > 0 && record.bytes_downloaded > record.total_bytes) {
        record.bytes_downloaded = record.total_bytes;
    }

    if (const auto stamp = readCount(in, "last_updated")) {
        record.last_updated = static_cast<std::int64_t>(*stamp);
    }
    if (auto error = readString(in, "error")) {
        record.error = std::move(*error);
    }
    return record;
}

json blobToJson(const ResumableSessionBlob& blob) {
    return json{
        {"url", blob.url},
        {"filename", blob.filename},
        {"blob", {{"offset", blob.offset}, {"method", blob.method}, {"headers", blob.headers}}},
    };
}

std::optional<ResumableSessionBlob> blobFromJson(const json& in) {
    if (!in.is_object()) {
        return std::nullopt;
    }
    const auto url = readString(in, "url");
    const auto filename = readString(in, "filename");
    auto inner = in.find("blob");
    if (!url || url->empty() || !filename || filename->empty() || inner == in.end() || !inner->is_object()) {
        return std::nullopt;
    }

    ResumableSessionBlob blob;
    blob.url = *url;
    blob.filename = *filename;

    const auto offset = readCount(*inner, "offset");
    if (!offset) {
        return std::nullopt;
    }
    blob.offset = *offset;

    if (auto method = readString(*inner, "method")) {
        blob.method = std::move(*method);
    }

    auto headers = inner->find("headers");
    if (headers != inner->end()) {
        if (!headers->is_object()) {
            return std::nullopt;
        }
        for (auto it = headers->begin(); it != headers->end(); ++it) {
            if (!it.value().is_string()) {
                return std::nullopt;
            }
            blob.headers[it.key()] = it.value().get<std::string>();
        }
    }
    return blob;
}

std::optional<DownloadId> parseId(const std::string& text) {
    if (text.empty() || text.size() > 19) {
        return std::nullopt;
    }
    DownloadId id = 0;
    for (const char c : text) {
        if (c < '0' || c > '9') {
            return std::nullopt;
        }
        id = id * 10 + static_cast<DownloadId>(c - '0');
    }
    if (id == 0) {
        return std::nullopt;
    }
    return id;
}

std::int64_t wallClockMillis() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

StateJournal::StateJournal(StateStore& store) : store_(store) {}

void StateJournal::load() {
    records_.clear();
    sessions_.clear();
    invalid_records_.clear();
    invalid_sessions_.clear();

    const auto text = store_.get(kStateKey);
    if (!text) {
        return;
    }

    json document;
    try {
        document = json::parse(*text);
    } catch (const json::parse_error& ex) {
        MODELFETCH_ERROR("Persisted download state is unreadable ({}), starting empty", ex.what());
        try {
            store_.set(kCorruptKey, *text);
        } catch (const PersistenceError& backup_error) {
            MODELFETCH_ERROR("Cannot keep a copy of the unreadable state: {}", backup_error.what());
        }
        return;
    }
    if (!document.is_object()) {
        MODELFETCH_ERROR("Persisted download state has unexpected shape, starting empty");
        return;
    }

    if (const auto version = readCount(document, "version"); version && *version > kFormatVersion) {
        MODELFETCH_WARN("Persisted download state has newer format version {}", *version);
    }

    DownloadId highest_id = 0;

    auto records = document.find("records");
    if (records != document.end() && records->is_object()) {
        for (auto it = records->begin(); it != records->end(); ++it) {
            auto record = it.key().empty() ? std::nullopt : recordFromJson(it.value());
            if (!record) {
                MODELFETCH_WARN("Ignoring malformed download record for {}", it.key());
                invalid_records_[it.key()] = it.value().dump();
                continue;
            }
            highest_id = std::max(highest_id, record->download_id);
            last_stamp_ = std::max(last_stamp_, record->last_updated);
            records_[it.key()] = std::move(*record);
        }
    }

    auto sessions = document.find("sessions");
    if (sessions != document.end() && sessions->is_object()) {
        for (auto it = sessions->begin(); it != sessions->end(); ++it) {
            const auto id = parseId(it.key());
            auto blob = id ? blobFromJson(it.value()) : std::nullopt;
            if (!blob) {
                MODELFETCH_WARN("Resumable session {} is malformed and cannot be resumed", it.key());
                invalid_sessions_[it.key()] = it.value().dump();
                continue;
            }
            highest_id = std::max(highest_id, *id);
            sessions_[*id] = std::move(*blob);
        }
    }

    const auto stored_next = readCount(document, "next_download_id").value_or(1);
    next_id_ = std::max<DownloadId>({stored_next, highest_id + 1, 1});
}

std::string StateJournal::serialize() const {
    json records = json::object();
    for (const auto& [filename, raw] : invalid_records_) {
        records[filename] = json::parse(raw, nullptr, false);
    }
    for (const auto& [filename, record] : records_) {
        records[filename] = recordToJson(record);
    }

    json sessions = json::object();
    for (const auto& [key, raw] : invalid_sessions_) {
        sessions[key] = json::parse(raw, nullptr, false);
    }
    for (const auto& [id, blob] : sessions_) {
        sessions[std::to_string(id)] = blobToJson(blob);
    }

    json document{
        {"version", kFormatVersion},
        {"next_download_id", next_id_},
        {"records", std::move(records)},
        {"sessions", std::move(sessions)},
    };
    return document.dump();
}

void StateJournal::commit() {
    std::string text;
    try {
        text = serialize();
    } catch (const json::exception& ex) {
        throw PersistenceError(std::string("Cannot encode download state: ") + ex.what());
    }
    store_.set(kStateKey, text);
}

void StateJournal::eraseInvalidRecord(const std::string& filename) { invalid_records_.erase(filename); }

void StateJournal::eraseInvalidSessionsFor(const std::string& filename) {
    for (auto it = invalid_sessions_.begin(); it != invalid_sessions_.end();) {
        const auto entry = json::parse(it->second, nullptr, false);
        const bool matches = entry.is_object() && entry.contains("filename") && entry["filename"].is_string() &&
                             entry["filename"].get<std::string>() == filename;
        it = matches ? invalid_sessions_.erase(it) : std::next(it);
    }
}

std::int64_t StateJournal::stamp() noexcept {
    last_stamp_ = std::max(wallClockMillis(), last_stamp_ + 1);
    return last_stamp_;
}

} // namespace modelfetch
