#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <optional>
#include <string>

namespace modelfetch {

// Durable key-value storage. Each call is atomic on its own and returns only
// once the change is durable; failures throw PersistenceError.
class StateStore {
public:
    virtual ~StateStore() = default;

    [[nodiscard]] virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual void set(const std::string& key, const std::string& value) = 0;
    virtual void remove(const std::string& key) = 0;
};

// One file per key inside a directory; writes go through a temporary file,
// fsync and rename.
class FileStateStore final : public StateStore {
public:
    explicit FileStateStore(std::filesystem::path directory);

    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    [[nodiscard]] const std::filesystem::path& directory() const noexcept { return directory_; }

private:
    [[nodiscard]] std::filesystem::path pathFor(const std::string& key) const;

    std::filesystem::path directory_;
    std::mutex mutex_;
};

class MemoryStateStore final : public StateStore {
public:
    [[nodiscard]] std::optional<std::string> get(const std::string& key) override;
    void set(const std::string& key, const std::string& value) override;
    void remove(const std::string& key) override;

    // Makes every following write throw PersistenceError (reads still work).
    void failWrites(bool fail);

private:
    std::mutex mutex_;
    std::map<std::string, std::string> values_;
    bool fail_writes_{false};
};

} // namespace modelfetch
