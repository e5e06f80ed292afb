#pragma once

#include <thread>
#include <mutex>
#include <condition_variable>
#include <functional>
#include <chrono>
#include <cstddef>
#include "scanEngine.hpp"

/**
 * ScanScheduler keeps the cache fresh: one scan at startup,
 * then one scan every interval on a background thread
 */
class ScanScheduler {
private:
    ScanEngine& engine;
    std::chrono::seconds interval;
    bool is_running;
    std::thread scan_thread;
    std::mutex state_mutex;
    std::condition_variable wake_cv;        // Interrupts the sleep on stop()

    // Called after every scan with the number of devices found
    std::function<void(size_t)> scan_complete_callback;

    void runOnce(const char* label);
    void scanLoop();

public:
    ScanScheduler(ScanEngine& engine, std::chrono::seconds interval = std::chrono::seconds(60));
    ~ScanScheduler();

    /**
     * Run the initial scan synchronously and start the periodic thread
     */
    void start();

    /**
     * Stop the periodic thread
     * A scan already in progress is allowed to finish
     */
    void stop();

    bool isRunning();

    void setScanCompleteCallback(std::function<void(size_t)> callback) {
        scan_complete_callback = callback;
    }
};
