#pragma once

#include "event_bus.hpp"
#include "progress.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>

namespace modelfetch {

// Terminal view of every download seen on the bus, redrawn in place.
class ConsoleProgressPanel {
public:
    ConsoleProgressPanel(ProgressEventBus& bus, std::ostream& out);

    ConsoleProgressPanel(const ConsoleProgressPanel&) = delete;
    ConsoleProgressPanel& operator=(const ConsoleProgressPanel&) = delete;

    // Redraws until nothing is starting or downloading, or `keep_going` returns false.
    template <typename Predicate>
    void run(std::chrono::milliseconds refresh, Predicate keep_going) {
        while (true) {
            render();
            if (!cache_.hasActive() || !keep_going()) {
                break;
            }
            waitFor(refresh);
        }
        render();
        out_ << std::flush;
    }

    void render();

    [[nodiscard]] const ProgressCache& cache() const noexcept { return cache_; }

    [[nodiscard]] std::string buildPanel() const;
    [[nodiscard]] static std::string formatTaskLine(const DownloadProgressEvent& event);
    [[nodiscard]] static std::string formatSize(std::uint64_t bytes);

private:
    void waitFor(std::chrono::milliseconds refresh);

    std::ostream& out_;
    ProgressCache cache_;
    std::size_t previous_lines_{0};
    ProgressEventBus::Subscription subscription_;
};

} // namespace modelfetch
