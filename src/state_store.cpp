#include "modelfetch/state_store.hpp"

#include "modelfetch/errors.hpp"

#include <cerrno>
#include <cstdio>
#include <cstring>
#include <memory>
#include <system_error>
#include <utility>

#include <fmt/format.h>
#include <unistd.h>

namespace modelfetch {

namespace {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

bool isPlainKeyChar(char c) {
    return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') || c == '-' || c == '_' ||
           c == '.';
}

} // namespace

FileStateStore::FileStateStore(std::filesystem::path directory) : directory_(std::move(directory)) {
    std::error_code ec;
    std::filesystem::create_directories(directory_, ec);
    if (ec) {
        throw PersistenceError(
            fmt::format("Failed to create state directory {}: {}", directory_.string(), ec.message()));
    }
}

std::filesystem::path FileStateStore::pathFor(const std::string& key) const {
    // 键名中的特殊字符转成 %XX, 避免路径穿越
    std::string name;
    name.reserve(key.size() + 8);
    for (const char c : key) {
        if (isPlainKeyChar(c)) {
            name.push_back(c);
        } else {
            name += fmt::format("%{:02X}", static_cast<unsigned char>(c));
        }
    }
    if (name.empty() || name.front() == '.') {
        name.insert(0, "%");
    }
    return directory_ / (name + ".state");
}

std::optional<std::string> FileStateStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = pathFor(key);

    FilePtr file{std::fopen(path.c_str(), "rb")};
    if (!file) {
        if (errno == ENOENT) {
            return std::nullopt;
        }
        throw PersistenceError(fmt::format("Cannot read {}: {}", path.string(), std::strerror(errno)));
    }

    std::string value;
    char buffer[8192];
    while (true) {
        const size_t read = std::fread(buffer, 1, sizeof(buffer), file.get());
        value.append(buffer, read);
        if (read < sizeof(buffer)) {
            break;
        }
    }
    if (std::ferror(file.get())) {
        throw PersistenceError(fmt::format("Read error on {}", path.string()));
    }
    return value;
}

void FileStateStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto path = pathFor(key);
    auto temp_path = path;
    temp_path += ".tmp";

    {
        FilePtr file{std::fopen(temp_path.c_str(), "wb")};
        if (!file) {
            throw PersistenceError(fmt::format("Cannot write {}: {}", temp_path.string(), std::strerror(errno)));
        }
        if (!value.empty() && std::fwrite(value.data(), 1, value.size(), file.get()) != value.size()) {
            throw PersistenceError(fmt::format("Short write on {}", temp_path.string()));
        }
        if (std::fflush(file.get()) != 0 || ::fsync(fileno(file.get())) != 0) {
            throw PersistenceError(fmt::format("Cannot flush {}: {}", temp_path.string(), std::strerror(errno)));
        }
    }

    std::error_code ec;
    std::filesystem::rename(temp_path, path, ec);
    if (ec) {
        std::filesystem::remove(temp_path, ec);
        throw PersistenceError(fmt::format("Cannot replace {}: {}", path.string(), ec.message()));
    }
}

void FileStateStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    std::filesystem::remove(pathFor(key), ec);
    if (ec) {
        throw PersistenceError(fmt::format("Cannot remove key {}: {}", key, ec.message()));
    }
}

std::optional<std::string> MemoryStateStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = values_.find(key);
    if (it == values_.end()) {
        return std::nullopt;
    }
    return it->second;
}

void MemoryStateStore::set(const std::string& key, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) {
        throw PersistenceError("Write rejected for key " + key);
    }
    values_[key] = value;
}

void MemoryStateStore::remove(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (fail_writes_) {
        throw PersistenceError("Remove rejected for key " + key);
    }
    values_.erase(key);
}

void MemoryStateStore::failWrites(bool fail) {
    std::lock_guard<std::mutex> lock(mutex_);
    fail_writes_ = fail;
}

} // namespace modelfetch
