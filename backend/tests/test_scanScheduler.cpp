#include <gtest/gtest.h>
#include <atomic>
#include <memory>
#include "scanScheduler.hpp"
#include "fakes.hpp"

using namespace std::chrono_literals;

class ScanSchedulerTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeCommandRunner> runner = std::make_shared<FakeCommandRunner>();
    FakeInspector inspector{{makeInterface("eth0", "192.168.7.2", "255.255.255.252", "02:00:00:00:00:02")}};
    HostProbe probe{runner};
    NeighborTableReader reader{runner, std::unique_ptr<NeighborTableParser>(new IpNeighParser())};
    ScanEngine engine{inspector, probe, reader};

    void SetUp() override {
        runner->setResult("ip", 0, "192.168.7.1 dev eth0 lladdr aa:bb:cc:dd:ee:01 REACHABLE\n");
    }
};

TEST_F(ScanSchedulerTest, InitialScanRunsSynchronously) {
    ScanScheduler scheduler(engine, 60s);
    std::atomic<int> scans{0};
    scheduler.setScanCompleteCallback([&scans](size_t) { scans++; });

    scheduler.start();

    EXPECT_EQ(scans.load(), 1);
    EXPECT_EQ(engine.getCache().snapshot().size(), 2u);
    EXPECT_TRUE(scheduler.isRunning());

    scheduler.stop();
    EXPECT_FALSE(scheduler.isRunning());
}

TEST_F(ScanSchedulerTest, RescansEveryInterval) {
    ScanScheduler scheduler(engine, 1s);
    std::atomic<int> scans{0};
    scheduler.setScanCompleteCallback([&scans](size_t) { scans++; });

    scheduler.start();
    std::this_thread::sleep_for(2500ms);
    scheduler.stop();

    EXPECT_GE(scans.load(), 2);
    EXPECT_LE(scans.load(), 4);
}

TEST_F(ScanSchedulerTest, StopInterruptsTheWait) {
    ScanScheduler scheduler(engine, 60s);
    scheduler.start();

    auto start = std::chrono::steady_clock::now();
    scheduler.stop();

    EXPECT_LT(std::chrono::steady_clock::now() - start, 2s);
}

TEST_F(ScanSchedulerTest, FailedScansDoNotStopTheLoop) {
    runner->setResult("ip", 1, "");
    ScanScheduler scheduler(engine, 1s);
    std::atomic<int> scans{0};
    std::atomic<size_t> last_count{99};
    scheduler.setScanCompleteCallback([&](size_t count) {
        scans++;
        last_count = count;
    });

    scheduler.start();
    std::this_thread::sleep_for(1500ms);

    EXPECT_TRUE(scheduler.isRunning());
    EXPECT_GE(scans.load(), 2);
    EXPECT_EQ(last_count.load(), 0u);

    scheduler.stop();
}
