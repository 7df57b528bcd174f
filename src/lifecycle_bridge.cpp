#include "modelfetch/lifecycle_bridge.hpp"

#include "modelfetch/log.hpp"

#include <algorithm>
#include <exception>

namespace modelfetch {

LifecycleBridge::~LifecycleBridge() { stopMaintenance(); }

void LifecycleBridge::attach(LifecycleObserver& observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (std::find(observers_.begin(), observers_.end(), &observer) == observers_.end()) {
        observers_.push_back(&observer);
    }
}

void LifecycleBridge::detach(LifecycleObserver& observer) {
    std::lock_guard<std::mutex> lock(mutex_);
    observers_.erase(std::remove(observers_.begin(), observers_.end(), &observer), observers_.end());
}

std::vector<LifecycleObserver*> LifecycleBridge::observers() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return observers_;
}

void LifecycleBridge::enterBackground() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        background_ = true;
    }
    MODELFETCH_INFO("Application moved to background");
    for (auto* observer : observers()) {
        try {
            observer->onBackground();
        } catch (const std::exception& ex) {
            MODELFETCH_ERROR("Background handler failed: {}", ex.what());
        }
    }
}

void LifecycleBridge::enterForeground() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        background_ = false;
    }
    MODELFETCH_INFO("Application moved to foreground");
    for (auto* observer : observers()) {
        try {
            observer->onForeground();
        } catch (const std::exception& ex) {
            MODELFETCH_ERROR("Foreground handler failed: {}", ex.what());
        }
    }
}

void LifecycleBridge::tick() {
    for (auto* observer : observers()) {
        try {
            observer->onMaintenanceTick();
        } catch (const std::exception& ex) {
            MODELFETCH_ERROR("Maintenance tick failed: {}", ex.what());
        }
    }
}

void LifecycleBridge::startMaintenance(std::chrono::milliseconds interval) {
    stopMaintenance();
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticker_stop_ = false;
    }
    ticker_ = std::thread([this, interval]() {
        std::unique_lock<std::mutex> lock(mutex_);
        while (!ticker_cv_.wait_for(lock, interval, [this] { return ticker_stop_; })) {
            lock.unlock();
            tick();
            lock.lock();
        }
    });
}

void LifecycleBridge::stopMaintenance() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        ticker_stop_ = true;
    }
    ticker_cv_.notify_all();
    if (ticker_.joinable()) {
        ticker_.join();
    }
}

bool LifecycleBridge::inBackground() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return background_;
}

} // namespace modelfetch
