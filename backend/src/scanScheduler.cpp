#include "scanScheduler.hpp"
#include <iostream>
#include <exception>

ScanScheduler::ScanScheduler(ScanEngine& engine, std::chrono::seconds interval)
    : engine(engine), interval(interval), is_running(false) {}

ScanScheduler::~ScanScheduler() {
    stop();
}

void ScanScheduler::start() {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        if (is_running) return;
        is_running = true;
    }

    runOnce("Initial scan");
    scan_thread = std::thread(&ScanScheduler::scanLoop, this);
}

void ScanScheduler::stop() {
    {
        std::lock_guard<std::mutex> lock(state_mutex);
        is_running = false;
    }
    wake_cv.notify_all();

    if (scan_thread.joinable()) {
        scan_thread.join();
    }
}

bool ScanScheduler::isRunning() {
    std::lock_guard<std::mutex> lock(state_mutex);
    return is_running;
}

void ScanScheduler::runOnce(const char* label) {
    std::cout << "Performing network scan..." << std::endl;

    size_t count = 0;
    try {
        count = engine.scan().size();
    } catch (const std::exception& e) {
        // scan() contains its own failures; this only guards the loop
        std::cerr << "Scan failed: " << e.what() << std::endl;
    }

    std::cout << label << " found " << count << " devices" << std::endl;

    if (scan_complete_callback) {
        scan_complete_callback(count);
    }
}

void ScanScheduler::scanLoop() {
    while (true) {
        {
            std::unique_lock<std::mutex> lock(state_mutex);
            if (wake_cv.wait_for(lock, interval, [this]() { return !is_running; })) {
                break;
            }
        }

        runOnce("Scan");
    }
}
