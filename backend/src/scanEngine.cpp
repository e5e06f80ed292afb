#include "scanEngine.hpp"
#include <iostream>
#include <algorithm>
#include <exception>
#include "addressRange.hpp"

ScanEngine::ScanEngine(const NetworkInterfaceInspector& inspector, const HostProbe& probe,
                       const NeighborTableReader& reader, size_t max_hosts)
    : inspector(inspector), probe(probe), reader(reader), max_hosts(max_hosts) {}

ScanResult ScanEngine::scan() {
    std::lock_guard<std::mutex> lock(scan_mutex);

    ScanResult devices;
    try {
        if (!runCycle(devices)) {
            return ScanResult();
        }
    } catch (const std::exception& e) {
        std::cerr << "Scan aborted: " << e.what() << std::endl;
        return ScanResult();
    }

    cache.replace(devices);
    return devices;
}

/**
 * Steps of one scan
 * @return: false if nothing should be published this cycle
 */
bool ScanEngine::runCycle(ScanResult& devices) {
    NetworkInfo network;
    if (!inspector.getPrimaryNetwork(network)) {
        std::cerr << "No local IPv4 network found, keeping previous results" << std::endl;
        return false;
    }

    std::vector<std::string> hosts = hostRange(network.ip, network.netmask, max_hosts);

    // Only the side effect matters: the OS now has neighbor entries for live hosts
    size_t abandoned = probe.probeAll(hosts);
    if (abandoned > 0) {
        std::cerr << abandoned << " probes did not finish in time" << std::endl;
    }

    if (!reader.read(devices)) {
        return false;
    }

    Device local;
    if (inspector.getPrimaryMachine(local)) {
        bool local_found = std::any_of(devices.begin(), devices.end(),
                                       [&local](const Device& d) { return d.ip == local.ip; });
        if (!local_found) {
            devices.push_back(local);
        }
    }

    return true;
}
