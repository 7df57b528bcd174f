#include "modelfetch/event_bus.hpp"

#include "modelfetch/log.hpp"

#include <atomic>
#include <condition_variable>
#include <deque>
#include <exception>
#include <map>
#include <mutex>
#include <utility>
#include <vector>

namespace modelfetch {

class ProgressEventBus::Core {
public:
    struct Entry {
        std::optional<std::string> key;
        Listener listener;
        ModelsListener models_listener;
    };

    // nullopt 表示已存储模型列表发生变化
    using Item = std::optional<DownloadProgressEvent>;

    std::uint64_t add(Entry entry) {
        std::lock_guard<std::mutex> lock(mutex_);
        const auto id = next_id_++;
        listeners_.emplace(id, std::move(entry));
        return id;
    }

    void remove(std::uint64_t id) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            listeners_.erase(id);
        }
        if (std::this_thread::get_id() != dispatcher_id_.load()) {
            // 等待正在进行的投递结束
            std::lock_guard<std::mutex> delivery(delivery_mutex_);
        }
    }

    void publish(Item item) {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (stopping_) {
                return;
            }
            queue_.push_back(std::move(item));
        }
        queue_cv_.notify_one();
    }

    void flush() {
        if (std::this_thread::get_id() == dispatcher_id_.load()) {
            return;
        }
        std::unique_lock<std::mutex> lock(mutex_);
        idle_cv_.wait(lock, [this] { return queue_.empty() && !delivering_; });
    }

    void stop() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            stopping_ = true;
        }
        queue_cv_.notify_all();
    }

    void run() {
        dispatcher_id_.store(std::this_thread::get_id());
        while (true) {
            std::unique_lock<std::mutex> lock(mutex_);
            queue_cv_.wait(lock, [this] { return stopping_ || !queue_.empty(); });
            if (queue_.empty()) {
                break;
            }

            auto item = std::move(queue_.front());
            queue_.pop_front();

            std::vector<Listener> targets;
            std::vector<ModelsListener> models_targets;
            for (const auto& entry : listeners_) {
                if (!item) {
                    if (entry.second.models_listener) {
                        models_targets.push_back(entry.second.models_listener);
                    }
                } else if (entry.second.listener && (!entry.second.key || *entry.second.key == item->model_name)) {
                    targets.push_back(entry.second.listener);
                }
            }

            std::unique_lock<std::mutex> delivery(delivery_mutex_);
            delivering_ = true;
            lock.unlock();

            for (const auto& listener : targets) {
                try {
                    listener(*item);
                } catch (const std::exception& ex) {
                    MODELFETCH_ERROR("Progress listener for {} threw: {}", item->model_name, ex.what());
                }
            }
            for (const auto& listener : models_targets) {
                try {
                    listener();
                } catch (const std::exception& ex) {
                    MODELFETCH_ERROR("Models-changed listener threw: {}", ex.what());
                }
            }

            delivery.unlock();
            lock.lock();
            delivering_ = false;
            if (queue_.empty()) {
                idle_cv_.notify_all();
            }
        }

        std::lock_guard<std::mutex> lock(mutex_);
        idle_cv_.notify_all();
    }

private:
    std::mutex mutex_;
    std::mutex delivery_mutex_;
    std::condition_variable queue_cv_;
    std::condition_variable idle_cv_;
    std::deque<Item> queue_;
    std::map<std::uint64_t, Entry> listeners_;
    std::uint64_t next_id_{1};
    bool stopping_{false};
    bool delivering_{false};
    std::atomic<std::thread::id> dispatcher_id_{};
};

ProgressEventBus::Subscription::Subscription(std::weak_ptr<void> core, std::uint64_t id)
    : core_(std::move(core)), id_(id) {}

ProgressEventBus::Subscription::Subscription(Subscription&& other) noexcept
    : core_(std::move(other.core_)), id_(std::exchange(other.id_, 0)) {}

ProgressEventBus::Subscription& ProgressEventBus::Subscription::operator=(Subscription&& other) noexcept {
    if (this != &other) {
        dispose();
        core_ = std::move(other.core_);
        id_ = std::exchange(other.id_, 0);
    }
    return *this;
}

ProgressEventBus::Subscription::~Subscription() { dispose(); }

void ProgressEventBus::Subscription::dispose() {
    if (id_ == 0) {
        return;
    }
    if (auto core = std::static_pointer_cast<Core>(core_.lock())) {
        core->remove(id_);
    }
    id_ = 0;
    core_.reset();
}

ProgressEventBus::ProgressEventBus() : core_(std::make_shared<Core>()) {
    auto core = core_;
    dispatcher_ = std::thread([core]() { core->run(); });
}

ProgressEventBus::~ProgressEventBus() {
    core_->stop();
    if (dispatcher_.joinable()) {
        dispatcher_.join();
    }
}

ProgressEventBus::Subscription ProgressEventBus::subscribe(const std::string& model_name, Listener listener) {
    return add(model_name, std::move(listener), nullptr);
}

ProgressEventBus::Subscription ProgressEventBus::subscribeAll(Listener listener) {
    return add(std::nullopt, std::move(listener), nullptr);
}

ProgressEventBus::Subscription ProgressEventBus::subscribeModelsChanged(ModelsListener listener) {
    return add(std::nullopt, nullptr, std::move(listener));
}

ProgressEventBus::Subscription ProgressEventBus::add(std::optional<std::string> key,
                                                     Listener listener,
                                                     ModelsListener models_listener) {
    const auto id = core_->add(Core::Entry{std::move(key), std::move(listener), std::move(models_listener)});
    return Subscription(std::weak_ptr<void>(std::static_pointer_cast<void>(core_)), id);
}

void ProgressEventBus::publish(DownloadProgressEvent event) { core_->publish(std::move(event)); }

void ProgressEventBus::publishModelsChanged() { core_->publish(std::nullopt); }

void ProgressEventBus::flush() { core_->flush(); }

} // namespace modelfetch
