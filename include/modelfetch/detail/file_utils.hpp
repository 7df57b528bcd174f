#pragma once

#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace modelfetch::detail {

struct FileDeleter {
    void operator()(FILE* fp) const noexcept {
        if (fp) {
            std::fclose(fp);
        }
    }
};

using FilePtr = std::unique_ptr<FILE, FileDeleter>;

// mkdir -p. Throws FilesystemError.
void ensureDirectory(const std::filesystem::path& dir);

[[nodiscard]] bool fileExists(const std::filesystem::path& path);

// Size of a regular file, nullopt when it does not exist or cannot be read.
[[nodiscard]] std::optional<std::uint64_t> fileSize(const std::filesystem::path& path);

// Idempotent delete: a missing file is not an error. Throws FilesystemError.
void removeFile(const std::filesystem::path& path);

// Replaces `to` if it exists. Throws FilesystemError.
void moveFile(const std::filesystem::path& from, const std::filesystem::path& to);

// Regular, non-hidden files directly inside `dir`, sorted by name.
[[nodiscard]] std::vector<std::filesystem::path> listFiles(const std::filesystem::path& dir);

// Opens `path` for writing, cut to `offset` bytes and positioned at the end.
// Throws FilesystemError.
[[nodiscard]] FilePtr openForAppend(const std::filesystem::path& path, std::uint64_t offset);

// Cuts an open file back to `size` bytes and moves the write position there.
void truncateOpenFile(FILE* file, std::uint64_t size);

[[nodiscard]] std::string modifiedTimestamp(const std::filesystem::path& path);

// true when `path` is `dir` itself or lies underneath it.
[[nodiscard]] bool isWithin(const std::filesystem::path& path, const std::filesystem::path& dir);

// Well-formed UTF-8: no overlong forms, surrogates or code points above U+10FFFF.
[[nodiscard]] bool isValidUtf8(std::string_view text) noexcept;

} // namespace modelfetch::detail
