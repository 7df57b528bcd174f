#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>

namespace modelfetch {

class LifecycleObserver {
public:
    virtual ~LifecycleObserver() = default;

    virtual void onBackground() = 0;
    virtual void onForeground() = 0;
    virtual void onMaintenanceTick() {}
};

// Fans host lifecycle transitions out to observers and optionally drives a
// periodic maintenance tick. Observers must outlive their attachment.
class LifecycleBridge {
public:
    LifecycleBridge() = default;
    ~LifecycleBridge();

    LifecycleBridge(const LifecycleBridge&) = delete;
    LifecycleBridge& operator=(const LifecycleBridge&) = delete;

    void attach(LifecycleObserver& observer);
    void detach(LifecycleObserver& observer);

    void enterBackground();
    void enterForeground();
    void tick();

    void startMaintenance(std::chrono::milliseconds interval);
    void stopMaintenance();

    [[nodiscard]] bool inBackground() const;

private:
    [[nodiscard]] std::vector<LifecycleObserver*> observers() const;

    mutable std::mutex mutex_;
    std::vector<LifecycleObserver*> observers_;
    bool background_{false};

    std::thread ticker_;
    std::condition_variable ticker_cv_;
    bool ticker_stop_{false};
};

} // namespace modelfetch
