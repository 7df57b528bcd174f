#pragma once

#include <optional>
#include <stdexcept>
#include <string>

namespace modelfetch {

class DownloadError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// 同一文件名已有未结束的下载
class AlreadyDownloadingError final : public DownloadError {
public:
    explicit AlreadyDownloadingError(const std::string& filename)
        : DownloadError("Download already in progress for " + filename), filename_(filename) {}

    [[nodiscard]] const std::string& filename() const noexcept { return filename_; }

private:
    std::string filename_;
};

class TransferError final : public DownloadError {
public:
    explicit TransferError(const std::string& message, std::optional<long> http_status = std::nullopt)
        : DownloadError(message), http_status_(http_status) {}

    [[nodiscard]] std::optional<long> httpStatus() const noexcept { return http_status_; }

private:
    std::optional<long> http_status_;
};

class ResumptionUnavailableError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class PersistenceError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class FilesystemError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class UnknownDownloadError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

class InvalidArgumentError final : public DownloadError {
public:
    using DownloadError::DownloadError;
};

} // namespace modelfetch
