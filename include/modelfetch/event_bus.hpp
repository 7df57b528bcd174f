#pragma once

#include "progress.hpp"

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace modelfetch {

// Publish/subscribe channel for download progress and for changes to the
// stored-model list. publish() only enqueues; a single dispatcher thread
// delivers both kinds in publish order, so a slow listener delays other
// listeners but never the transfer that published.
class ProgressEventBus {
public:
    using Listener = std::function<void(const DownloadProgressEvent&)>;
    using ModelsListener = std::function<void()>;

    class Subscription {
    public:
        Subscription() = default;
        Subscription(Subscription&& other) noexcept;
        Subscription& operator=(Subscription&& other) noexcept;
        Subscription(const Subscription&) = delete;
        Subscription& operator=(const Subscription&) = delete;
        ~Subscription();

        // After dispose() returns the listener is not running and will not be called again,
        // unless dispose() is called from inside that listener.
        void dispose();
        [[nodiscard]] bool active() const noexcept { return id_ != 0; }

    private:
        friend class ProgressEventBus;
        Subscription(std::weak_ptr<void> core, std::uint64_t id);

        std::weak_ptr<void> core_;
        std::uint64_t id_{0};
    };

    ProgressEventBus();
    ~ProgressEventBus();

    ProgressEventBus(const ProgressEventBus&) = delete;
    ProgressEventBus& operator=(const ProgressEventBus&) = delete;

    // Events for one file only.
    [[nodiscard]] Subscription subscribe(const std::string& model_name, Listener listener);
    [[nodiscard]] Subscription subscribeAll(Listener listener);
    // Called after a model was linked, deleted or finished downloading.
    [[nodiscard]] Subscription subscribeModelsChanged(ModelsListener listener);

    void publish(DownloadProgressEvent event);
    void publishModelsChanged();

    // Blocks until every event published so far has been delivered.
    void flush();

private:
    class Core;

    Subscription add(std::optional<std::string> key, Listener listener, ModelsListener models_listener);

    std::shared_ptr<Core> core_;
    std::thread dispatcher_;
};

} // namespace modelfetch
