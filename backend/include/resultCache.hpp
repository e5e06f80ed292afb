#pragma once

#include <memory>
#include <mutex>
#include "protocol.hpp"

/**
 * ResultCache holds the devices of the most recent successful scan
 * Written by the scanner thread, read by HTTP request threads
 * The list is immutable once stored; replace swaps the whole list
 */
class ResultCache {
private:
    std::shared_ptr<const ScanResult> latest;
    mutable std::mutex latest_mutex;        // Guards the pointer only

public:
    ResultCache();

    /**
     * Replace the stored list
     */
    void replace(ScanResult devices);

    /**
     * Independent copy of the stored list (empty before the first scan)
     */
    ScanResult snapshot() const;
};
