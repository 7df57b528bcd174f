#include "modelfetch/download_session.hpp"

#include "modelfetch/detail/file_utils.hpp"
#include "modelfetch/errors.hpp"
#include "modelfetch/log.hpp"

#include <cstdio>
#include <exception>
#include <utility>

#include <unistd.h>

namespace modelfetch {

DownloadSession::DownloadSession(DownloadId id,
                                 std::string filename,
                                 std::string url,
                                 std::filesystem::path partial_path,
                                 HttpClient& http,
                                 Callbacks callbacks,
                                 std::chrono::milliseconds progress_interval)
    : id_(id),
      filename_(std::move(filename)),
      url_(std::move(url)),
      partial_path_(std::move(partial_path)),
      http_(http),
      callbacks_(std::move(callbacks)),
      progress_interval_(progress_interval) {}

DownloadSession::~DownloadSession() {
    requestStop(StopReason::Shutdown);
    join();
    // 在自身工作线程上析构时无法 join
    if (worker_.joinable()) {
        worker_.detach();
    }
}

void DownloadSession::start(std::uint64_t offset,
                            std::uint64_t known_total,
                            std::map<std::string, std::string> headers) {
    join();

    stop_reason_.store(StopReason::None);
    bytes_written_.store(offset);
    total_bytes_.store(known_total);
    abort_ = std::make_shared<AbortSignal>();
    running_.store(true);

    HttpRequest request;
    request.url = url_;
    request.headers = std::move(headers);
    request.range_start = offset;

    worker_ = std::thread([this, offset, known_total, request = std::move(request), abort = abort_]() mutable {
        run(offset, known_total, std::move(request), std::move(abort));
    });
}

void DownloadSession::requestStop(StopReason reason) noexcept {
    auto expected = StopReason::None;
    stop_reason_.compare_exchange_strong(expected, reason);
    if (abort_) {
        abort_->abort();
    }
}

void DownloadSession::join() {
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }
}

void DownloadSession::run(std::uint64_t offset,
                          std::uint64_t known_total,
                          HttpRequest request,
                          std::shared_ptr<AbortSignal> abort) {
    using Clock = std::chrono::steady_clock;

    SessionResult result;
    result.bytes_downloaded = offset;
    result.total_bytes = known_total;

    auto last_report = Clock::now();
    std::uint64_t last_report_bytes = offset;
    bool restarted = false;

    auto report = [&](bool force) {
        const auto now = Clock::now();
        if (!force && now - last_report < progress_interval_) {
            return;
        }
        TransferProgress progress;
        progress.bytes_downloaded = bytes_written_.load();
        progress.total_bytes = total_bytes_.load();
        progress.restarted = std::exchange(restarted, false);

        const double seconds = std::chrono::duration<double>(now - last_report).count();
        if (seconds > 0.0 && progress.bytes_downloaded >= last_report_bytes) {
            progress.speed_bps = static_cast<double>(progress.bytes_downloaded - last_report_bytes) / seconds;
        }
        if (progress.speed_bps > 0.0 && progress.total_bytes > progress.bytes_downloaded) {
            progress.eta_seconds =
                static_cast<double>(progress.total_bytes - progress.bytes_downloaded) / progress.speed_bps;
        }
        last_report = now;
        last_report_bytes = progress.bytes_downloaded;

        if (callbacks_.on_progress) {
            callbacks_.on_progress(*this, progress);
        }
    };

    try {
        auto file = detail::openForAppend(partial_path_, offset);

        auto on_head = [&](const HttpResponseHead& head) {
            std::uint64_t total = 0;
            if (offset > 0 && head.status_code == 200) {
                // 服务器不支持断点续传, 从头开始
                MODELFETCH_WARN("{}: server ignored the range request, restarting from zero", filename_);
                detail::truncateOpenFile(file.get(), 0);
                bytes_written_.store(0);
                last_report_bytes = 0;
                restarted = true;
                total = head.content_length;
            } else if (head.status_code == 206) {
                if (head.range_start && *head.range_start != offset) {
                    throw TransferError("Server answered with an unexpected byte range", head.status_code);
                }
                total = head.total_size > 0 ? head.total_size
                                            : (head.content_length > 0 ? offset + head.content_length : 0);
            } else {
                total = head.content_length;
            }
            if (total == 0) {
                total = known_total;
            }
            total_bytes_.store(total);
            report(true);
        };

        auto on_data = [&](const char* data, std::size_t size) {
            const size_t written = std::fwrite(data, 1, size, file.get());
            if (written != size) {
                throw FilesystemError("Failed to write output file");
            }
            const auto bytes = bytes_written_.fetch_add(written) + written;
            const auto total = total_bytes_.load();
            if (total > 0 && bytes > total) {
                throw TransferError("Received more data than the server announced");
            }
            if (Clock::now() - last_report >= progress_interval_) {
                std::fflush(file.get());
                report(false);
            }
        };

        const auto outcome = http_.fetch(request, on_head, on_data, *abort);

        if (std::fflush(file.get()) != 0 || ::fsync(fileno(file.get())) != 0) {
            throw FilesystemError("Failed to flush output file");
        }
        file.reset();

        result.bytes_downloaded = bytes_written_.load();
        result.total_bytes = total_bytes_.load();
        result.kind = outcome == TransferOutcome::Aborted ? SessionResult::Kind::Stopped
                                                          : SessionResult::Kind::Completed;
    } catch (const TransferError& ex) {
        result.bytes_downloaded = bytes_written_.load();
        result.total_bytes = total_bytes_.load();
        if (abort->aborted()) {
            result.kind = SessionResult::Kind::Stopped;
        } else if (ex.httpStatus() == 416L && offset > 0 && known_total > 0 && offset >= known_total) {
            // 续传起点已经是文件末尾
            result.kind = SessionResult::Kind::Completed;
            result.bytes_downloaded = offset;
            result.total_bytes = known_total;
        } else {
            result.kind = SessionResult::Kind::Failed;
            result.error = ex.what();
        }
    } catch (const std::exception& ex) {
        result.bytes_downloaded = bytes_written_.load();
        result.total_bytes = total_bytes_.load();
        result.kind = abort->aborted() ? SessionResult::Kind::Stopped : SessionResult::Kind::Failed;
        result.error = ex.what();
    }

    if (callbacks_.on_finished) {
        try {
            callbacks_.on_finished(*this, result);
        } catch (const std::exception& ex) {
            MODELFETCH_ERROR("{}: completion handling failed: {}", filename_, ex.what());
        }
    }
    running_.store(false);
}

} // namespace modelfetch
