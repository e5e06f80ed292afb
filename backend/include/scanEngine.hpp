#pragma once

#include <cstddef>
#include <mutex>
#include "protocol.hpp"
#include "networkInterfaces.hpp"
#include "hostProbe.hpp"
#include "neighborTable.hpp"
#include "resultCache.hpp"

/**
 * ScanEngine runs one discovery cycle:
 * interfaces -> host range -> ping sweep -> neighbor table -> local machine
 * and publishes the result to its cache
 */
class ScanEngine {
private:
    const NetworkInterfaceInspector& inspector;
    const HostProbe& probe;
    const NeighborTableReader& reader;
    size_t max_hosts;                 // Sweep at most this many addresses
    ResultCache cache;
    std::mutex scan_mutex;            // One cycle at a time

    bool runCycle(ScanResult& devices);

public:
    ScanEngine(const NetworkInterfaceInspector& inspector, const HostProbe& probe,
               const NeighborTableReader& reader, size_t max_hosts = 254);

    /**
     * Perform one scan
     * If no local network is found or the neighbor table cannot be read,
     * returns an empty list and the previous cache contents stay in place
     * @return: Copy of the devices stored in the cache
     */
    ScanResult scan();

    ResultCache& getCache() { return cache; }
    const ResultCache& getCache() const { return cache; }
};
