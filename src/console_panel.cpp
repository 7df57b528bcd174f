#include "modelfetch/console_panel.hpp"

#include <algorithm>
#include <thread>

#include <fmt/format.h>

namespace modelfetch {

namespace {

constexpr std::size_t kNameWidth = 20;
constexpr int kBarWidth = 30;

} // namespace

ConsoleProgressPanel::ConsoleProgressPanel(ProgressEventBus& bus, std::ostream& out) : out_(out) {
    subscription_ = bus.subscribeAll([this](const DownloadProgressEvent& event) { cache_.apply(event); });
}

void ConsoleProgressPanel::render() {
    const auto panel = buildPanel();
    const auto current_lines = static_cast<std::size_t>(std::count(panel.begin(), panel.end(), '\n'));
    if (previous_lines_ > 0) {
        out_ << "\033[" << previous_lines_ << "F\033[J";
    }
    out_ << panel;
    previous_lines_ = current_lines;
}

void ConsoleProgressPanel::waitFor(std::chrono::milliseconds refresh) {
    std::this_thread::sleep_for(refresh);
}

std::string ConsoleProgressPanel::buildPanel() const {
    const auto events = cache_.snapshot();

    std::string panel;
    panel.reserve(events.size() * 128 + 256);
    panel.append("==================================================\n");
    panel += fmt::format("modelfetch ({} downloads)\n", events.size());
    panel.append("--------------------------------------------------\n");

    std::uint64_t total_all = 0;
    std::uint64_t downloaded_all = 0;
    for (const auto& event : events) {
        panel += formatTaskLine(event);
        panel.push_back('\n');
        total_all += event.total_bytes;
        downloaded_all += event.bytes_downloaded;
    }

    panel.append("--------------------------------------------------\n");
    if (total_all > 0) {
        panel += fmt::format("Overall: {:>3}%", progressPercent(downloaded_all, total_all));
    } else {
        panel.append("Overall: N/A");
    }
    panel.push_back('\n');
    panel.append("==================================================\n");
    return panel;
}

std::string ConsoleProgressPanel::formatTaskLine(const DownloadProgressEvent& event) {
    std::string display_name = event.model_name;
    if (display_name.size() > kNameWidth) {
        display_name = display_name.substr(0, kNameWidth);
    }
    if (display_name.empty()) {
        display_name = "(unnamed)";
    }

    std::string line;
    line.reserve(256);

    if (event.total_bytes == 0 && event.status != DownloadStatus::Failed) {
        line += fmt::format("{:<20} [{}] {}", display_name, "Initializing...", formatSize(event.bytes_downloaded));
    } else {
        const int bar_pos = event.progress * kBarWidth / 100;
        std::string bar;
        bar.reserve(static_cast<std::size_t>(kBarWidth) * 3);
        for (int i = 0; i < kBarWidth; ++i) {
            bar += (i < bar_pos) ? u8"█" : u8"░";
        }
        line += fmt::format("{:<20} [{}] {:>3}% ({}/{})",
                            display_name,
                            bar,
                            event.progress,
                            formatSize(event.bytes_downloaded),
                            formatSize(event.total_bytes));
    }

    switch (event.status) {
    case DownloadStatus::Downloading:
        if (event.speed_bps > 0.0) {
            line += fmt::format("  {}/s", formatSize(static_cast<std::uint64_t>(event.speed_bps)));
            if (event.eta_seconds > 0.0) {
                line += fmt::format(" ETA {:.0f}s", event.eta_seconds);
            }
        }
        break;
    case DownloadStatus::Paused:
        line.append("  || Paused");
        break;
    case DownloadStatus::Completed:
        line.append(u8"  ✅ Done");
        break;
    case DownloadStatus::Failed:
        line += fmt::format(u8"  ❌ {}", event.error.value_or("failed"));
        break;
    default:
        break;
    }
    return line;
}

std::string ConsoleProgressPanel::formatSize(std::uint64_t bytes) {
    constexpr double KB = 1024.0;
    constexpr double MB = KB * 1024.0;
    constexpr double GB = MB * 1024.0;

    const double value = static_cast<double>(bytes);
    if (bytes >= static_cast<std::uint64_t>(GB)) {
        return fmt::format("{:.1f} GB", value / GB);
    } else if (bytes >= static_cast<std::uint64_t>(MB)) {
        return fmt::format("{:.1f} MB", value / MB);
    } else if (bytes >= static_cast<std::uint64_t>(KB)) {
        return fmt::format("{:.1f} KB", value / KB);
    } else {
        return fmt::format("{} B", bytes);
    }
}

} // namespace modelfetch
