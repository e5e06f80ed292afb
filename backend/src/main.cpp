#include <iostream>
#include <thread>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <atomic>
#include <memory>
#include <stdexcept>
#include "agentConfig.hpp"
#include "commandRunner.hpp"
#include "networkInterfaces.hpp"
#include "hostProbe.hpp"
#include "neighborTable.hpp"
#include "scanEngine.hpp"
#include "scanScheduler.hpp"
#include "scanHttpServer.hpp"
#include "serviceAdvertiser.hpp"

std::atomic<bool> g_running{true};

/**
 * Signal handler for graceful shutdown
 */
void signalHandler(int signum) {
    static volatile std::sig_atomic_t already_shutting_down = 0;

    if (already_shutting_down) {
        // Second Ctrl+C: do not wait for in-flight scans
        std::_Exit(128 + signum);
    }

    already_shutting_down = 1;
    g_running = false;
}

/**
 * Main function
 */
int main(int argc, char* argv[]) {
    AgentConfig config;

    try {
        switch (parseArguments(argc, argv, config)) {
            case CliAction::SHOW_VERSION:
                std::cout << "lanagent " << LANAGENT_VERSION << std::endl;
                return 0;
            case CliAction::SHOW_HELP:
                std::cout << usage(argv[0]);
                return 0;
            case CliAction::RUN:
                break;
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << "Error: " << e.what() << "\n\n" << usage(argv[0]);
        return 2;
    }

    // Register signal handlers for Ctrl+C and service managers
    signal(SIGINT, signalHandler);
    signal(SIGTERM, signalHandler);
    signal(SIGPIPE, SIG_IGN);

    auto runner = std::make_shared<ProcessCommandRunner>();
    NetworkInterfaceInspector inspector(config.virtual_prefixes);
    HostProbe probe(runner, config.probe_batch_size, config.probe_timeout);
    NeighborTableReader reader(runner, makeNeighborTableParser(), config.neighbor_timeout);
    ScanEngine engine(inspector, probe, reader, config.max_hosts);

    ScanHttpServer server(engine.getCache(), config.port);
    if (!server.start()) {
        std::cerr << "Error: cannot start HTTP server on port " << config.port << std::endl;
        return 1;
    }

    ServiceAdvertiser advertiser(makeServiceRecord(config, server.getPort(), inspector));
    if (!advertiser.start()) {
        std::cerr << "Error: cannot register the service via mDNS" << std::endl;
        server.stop();
        return 1;
    }

    ScanScheduler scheduler(engine, config.scan_interval);
    scheduler.start();

    std::cout << "\nService is running. Press Ctrl+C to stop." << std::endl;

    // Keep main thread alive
    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
    }

    std::cout << "\nShutting down..." << std::endl;
    scheduler.stop();
    advertiser.stop();
    server.stop();

    std::cout << "Shutdown complete." << std::endl;
    return 0;
}
