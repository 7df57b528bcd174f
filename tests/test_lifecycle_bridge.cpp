#include <gtest/gtest.h>

#include "modelfetch/lifecycle_bridge.hpp"
#include "support/test_helpers.hpp"

#include <atomic>
#include <chrono>
#include <stdexcept>
#include <thread>

using namespace modelfetch;
using namespace modelfetch::test_support;

namespace {

class CountingObserver : public LifecycleObserver {
public:
    void onBackground() override { ++background; }
    void onForeground() override { ++foreground; }
    void onMaintenanceTick() override { ++ticks; }

    std::atomic<int> background{0};
    std::atomic<int> foreground{0};
    std::atomic<int> ticks{0};
};

class ThrowingObserver : public LifecycleObserver {
public:
    void onBackground() override { throw std::runtime_error("background failed"); }
    void onForeground() override { throw std::runtime_error("foreground failed"); }
};

} // namespace

TEST(LifecycleBridge, FansTransitionsOut) {
    LifecycleBridge bridge;
    CountingObserver first;
    CountingObserver second;
    bridge.attach(first);
    bridge.attach(second);
    bridge.attach(first);

    EXPECT_FALSE(bridge.inBackground());
    bridge.enterBackground();
    EXPECT_TRUE(bridge.inBackground());
    bridge.enterForeground();
    EXPECT_FALSE(bridge.inBackground());

    EXPECT_EQ(first.background.load(), 1);
    EXPECT_EQ(first.foreground.load(), 1);
    EXPECT_EQ(second.background.load(), 1);

    bridge.detach(second);
    bridge.tick();
    EXPECT_EQ(first.ticks.load(), 1);
    EXPECT_EQ(second.ticks.load(), 0);
}

TEST(LifecycleBridge, FailingObserverDoesNotBlockOthers) {
    LifecycleBridge bridge;
    ThrowingObserver bad;
    CountingObserver good;
    bridge.attach(bad);
    bridge.attach(good);

    bridge.enterBackground();
    bridge.enterForeground();
    bridge.tick();
    EXPECT_EQ(good.background.load(), 1);
    EXPECT_EQ(good.foreground.load(), 1);
    EXPECT_EQ(good.ticks.load(), 1);
}

TEST(LifecycleBridge, MaintenanceTicksUntilStopped) {
    LifecycleBridge bridge;
    CountingObserver observer;
    bridge.attach(observer);

    bridge.startMaintenance(std::chrono::milliseconds(5));
    EXPECT_TRUE(waitUntil([&] { return observer.ticks.load() >= 3; }));
    bridge.stopMaintenance();

    const int stopped_at = observer.ticks.load();
    std::this_thread::sleep_for(std::chrono::milliseconds(30));
    EXPECT_EQ(observer.ticks.load(), stopped_at);
}
