#include "modelfetch/detail/file_utils.hpp"

#include "modelfetch/errors.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <ctime>
#include <iterator>
#include <system_error>

#include <fmt/chrono.h>
#include <fmt/format.h>
#include <sys/stat.h>
#include <unistd.h>

namespace modelfetch::detail {

namespace fs = std::filesystem;

void ensureDirectory(const fs::path& dir) {
    std::error_code ec;
    fs::create_directories(dir, ec);
    if (ec) {
        throw FilesystemError(fmt::format("Failed to create directory {}: {}", dir.string(), ec.message()));
    }
}

bool fileExists(const fs::path& path) {
    std::error_code ec;
    return fs::is_regular_file(path, ec);
}

std::optional<std::uint64_t> fileSize(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        return std::nullopt;
    }
    const auto size = fs::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

void removeFile(const fs::path& path) {
    std::error_code ec;
    fs::remove(path, ec);
    if (ec && ec != std::errc::no_such_file_or_directory) {
        throw FilesystemError(fmt::format("Failed to delete {}: {}", path.string(), ec.message()));
    }
}

void moveFile(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (!fs::exists(from, ec)) {
        throw FilesystemError(fmt::format("Source file does not exist: {}", from.string()));
    }
    ensureDirectory(to.parent_path());
    fs::rename(from, to, ec);
    if (ec) {
        throw FilesystemError(
            fmt::format("Failed to move {} to {}: {}", from.string(), to.string(), ec.message()));
    }
}

std::vector<fs::path> listFiles(const fs::path& dir) {
    std::vector<fs::path> files;
    std::error_code ec;
    if (!fs::is_directory(dir, ec)) {
        return files;
    }

    for (fs::directory_iterator it(dir, ec), end; !ec && it != end; it.increment(ec)) {
        const auto name = it->path().filename().string();
        if (name.empty() || name.front() == '.') {
            continue;
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            files.push_back(it->path());
        }
    }
    if (ec) {
        throw FilesystemError(fmt::format("Failed to read directory {}: {}", dir.string(), ec.message()));
    }

    std::sort(files.begin(), files.end());
    return files;
}

FilePtr openForAppend(const fs::path& path, std::uint64_t offset) {
    ensureDirectory(path.parent_path());

    FilePtr file{std::fopen(path.c_str(), offset == 0 ? "wb" : "r+b")};
    if (!file && offset > 0 && errno == ENOENT) {
        throw FilesystemError(fmt::format("Partial file is missing: {}", path.string()));
    }
    if (!file) {
        throw FilesystemError(fmt::format("Cannot open {}: {}", path.string(), std::strerror(errno)));
    }
    truncateOpenFile(file.get(), offset);
    return file;
}

void truncateOpenFile(FILE* file, std::uint64_t size) {
    if (std::fflush(file) != 0) {
        throw FilesystemError(fmt::format("Cannot flush output file: {}", std::strerror(errno)));
    }
    if (ftruncate(fileno(file), static_cast<off_t>(size)) == -1) {
        throw FilesystemError(fmt::format("Cannot resize output file: {}", std::strerror(errno)));
    }
    if (fseeko(file, static_cast<off_t>(size), SEEK_SET) != 0) {
        throw FilesystemError(fmt::format("Cannot seek output file: {}", std::strerror(errno)));
    }
}

std::string modifiedTimestamp(const fs::path& path) {
    struct stat info {};
    if (::stat(path.c_str(), &info) != 0) {
        return {};
    }
    const std::time_t modified = info.st_mtime;
    return fmt::format("{:%Y-%m-%dT%H:%M:%SZ}", fmt::gmtime(modified));
}

bool isWithin(const fs::path& path, const fs::path& dir) {
    std::error_code ec;
    const auto normal_path = fs::weakly_canonical(path, ec);
    if (ec) {
        return false;
    }
    const auto normal_dir = fs::weakly_canonical(dir, ec);
    if (ec) {
        return false;
    }
    auto dir_it = normal_dir.begin();
    auto path_it = normal_path.begin();
    for (; dir_it != normal_dir.end(); ++dir_it, ++path_it) {
        if (dir_it->empty() && std::next(dir_it) == normal_dir.end()) {
            break; // trailing separator
        }
        if (path_it == normal_path.end() || *dir_it != *path_it) {
            return false;
        }
    }
    return true;
}

bool isValidUtf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        std::size_t length = 0;
        std::uint32_t code = 0;
        if (lead < 0x80) {
            ++i;
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code = lead & 0x07;
        } else {
            return false;
        }
        if (i + length > text.size()) {
            return false;
        }
        for (std::size_t k = 1; k < length; ++k) {
            const auto next = static_cast<unsigned char>(text[i + k]);
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code = (code << 6) | (next & 0x3F);
        }
        // 过长编码, 代理区, 超出 Unicode 范围
        static constexpr std::uint32_t kMinimum[] = {0, 0, 0x80, 0x800, 0x10000};
        if (code < kMinimum[length] || (code >= 0xD800 && code <= 0xDFFF) || code > 0x10FFFF) {
            return false;
        }
        i += length;
    }
    return true;
}

} // namespace modelfetch::detail
