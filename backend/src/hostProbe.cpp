#include "hostProbe.hpp"
#include <iostream>
#include <thread>
#include <mutex>
#include <condition_variable>
#include <system_error>
#include <algorithm>
#include <utility>

using namespace std::chrono_literals;

namespace {

/**
 * Completion counter shared by the probe threads of one batch
 * Owned jointly so an abandoned thread never touches freed state
 */
struct BatchState {
    std::mutex mutex;
    std::condition_variable done_cv;
    size_t pending = 0;
};

} // namespace

HostProbe::HostProbe(std::shared_ptr<CommandRunner> runner, size_t batch_size,
                     std::chrono::milliseconds probe_timeout)
    : runner(std::move(runner)), batch_size(std::max<size_t>(batch_size, 1)),
      probe_timeout(probe_timeout), join_timeout(probe_timeout + 1s) {}

std::vector<std::string> HostProbe::pingCommand(const std::string& ip) {
#ifdef __APPLE__
    // -W is in milliseconds on macOS, -t bounds the whole run in seconds
    return {"ping", "-c", "1", "-W", "1000", "-t", "1", ip};
#else
    return {"ping", "-c", "1", "-W", "1", ip};
#endif
}

bool HostProbe::probe(const std::string& ip) const {
    try {
        CommandResult result = runner->run(pingCommand(ip), probe_timeout);
        return result.succeeded();
    } catch (const std::exception& e) {
        std::cerr << "Probe of " << ip << " failed: " << e.what() << std::endl;
        return false;
    }
}

size_t HostProbe::probeAll(const std::vector<std::string>& ips) const {
    size_t abandoned = 0;

    for (size_t start = 0; start < ips.size(); start += batch_size) {
        size_t end = std::min(start + batch_size, ips.size());

        auto state = std::make_shared<BatchState>();
        std::shared_ptr<CommandRunner> shared_runner = runner;
        std::chrono::milliseconds timeout = probe_timeout;

        for (size_t i = start; i < end; i++) {
            {
                std::lock_guard<std::mutex> lock(state->mutex);
                state->pending++;
            }

            try {
                std::thread([state, shared_runner, timeout, ip = ips[i]]() {
                    try {
                        shared_runner->run(pingCommand(ip), timeout);
                    } catch (const std::exception& e) {
                        std::cerr << "Probe of " << ip << " failed: " << e.what() << std::endl;
                    }

                    std::lock_guard<std::mutex> lock(state->mutex);
                    state->pending--;
                    state->done_cv.notify_all();
                }).detach();
            } catch (const std::system_error& e) {
                std::cerr << "Failed to start probe thread for " << ips[i] << ": " << e.what() << std::endl;
                std::lock_guard<std::mutex> lock(state->mutex);
                state->pending--;
            }
        }

        std::unique_lock<std::mutex> lock(state->mutex);
        if (!state->done_cv.wait_for(lock, join_timeout, [&state]() { return state->pending == 0; })) {
            abandoned += state->pending;
        }
    }

    return abandoned;
}
