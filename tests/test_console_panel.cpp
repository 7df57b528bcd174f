#include <gtest/gtest.h>

#include "modelfetch/console_panel.hpp"
#include "modelfetch/event_bus.hpp"

#include <sstream>

using namespace modelfetch;

TEST(ConsoleProgressPanel, FormatsSizes) {
    EXPECT_EQ(ConsoleProgressPanel::formatSize(0), "0 B");
    EXPECT_EQ(ConsoleProgressPanel::formatSize(1023), "1023 B");
    EXPECT_EQ(ConsoleProgressPanel::formatSize(1536), "1.5 KB");
    EXPECT_EQ(ConsoleProgressPanel::formatSize(5ull * 1024 * 1024), "5.0 MB");
    EXPECT_EQ(ConsoleProgressPanel::formatSize(3ull * 1024 * 1024 * 1024), "3.0 GB");
}

TEST(ConsoleProgressPanel, TaskLineShowsStatus) {
    DownloadProgressEvent event;
    event.model_name = "a-rather-long-model-name.gguf";
    event.total_bytes = 2048;
    event.bytes_downloaded = 1024;
    event.progress = 50;
    event.status = DownloadStatus::Paused;

    const auto paused = ConsoleProgressPanel::formatTaskLine(event);
    EXPECT_EQ(paused.rfind("a-rather-long-model-", 0), 0u);
    EXPECT_NE(paused.find(" 50%"), std::string::npos);
    EXPECT_NE(paused.find("Paused"), std::string::npos);

    event.status = DownloadStatus::Failed;
    event.error = "HTTP error 404";
    EXPECT_NE(ConsoleProgressPanel::formatTaskLine(event).find("HTTP error 404"), std::string::npos);

    event.total_bytes = 0;
    event.status = DownloadStatus::Starting;
    EXPECT_NE(ConsoleProgressPanel::formatTaskLine(event).find("Initializing"), std::string::npos);
}

TEST(ConsoleProgressPanel, RendersEventsFromBus) {
    ProgressEventBus bus;
    std::ostringstream out;
    ConsoleProgressPanel panel(bus, out);

    DownloadProgressEvent event;
    event.model_name = "m.bin";
    event.total_bytes = 100;
    event.bytes_downloaded = 100;
    event.progress = 100;
    event.status = DownloadStatus::Completed;
    event.last_updated = 1;
    bus.publish(event);
    bus.flush();

    EXPECT_FALSE(panel.cache().hasActive());
    panel.run(std::chrono::milliseconds(1), [] { return true; });
    const auto text = out.str();
    EXPECT_NE(text.find("(1 downloads)"), std::string::npos);
    EXPECT_NE(text.find("Overall: 100%"), std::string::npos);
    EXPECT_NE(text.find("Done"), std::string::npos);
}
