#include "resultCache.hpp"
#include <utility>

ResultCache::ResultCache() : latest(std::make_shared<const ScanResult>()) {}

void ResultCache::replace(ScanResult devices) {
    auto next = std::make_shared<const ScanResult>(std::move(devices));
    std::lock_guard<std::mutex> lock(latest_mutex);
    latest.swap(next);
}

ScanResult ResultCache::snapshot() const {
    std::shared_ptr<const ScanResult> current;
    {
        std::lock_guard<std::mutex> lock(latest_mutex);
        current = latest;
    }
    // Copy outside the lock, the list behind current never changes
    return *current;
}
