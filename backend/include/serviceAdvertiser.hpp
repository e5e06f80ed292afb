#pragma once

#include <string>
#include <thread>
#include <atomic>
#include <cstdint>
#include "mdnsMessage.hpp"
#include "agentConfig.hpp"
#include "networkInterfaces.hpp"

/**
 * Build the record published for this agent from the machine's short hostname
 */
ServiceRecord makeServiceRecord(const AgentConfig& config, int port,
                                const NetworkInterfaceInspector& inspector);

/**
 * Build the record published for this agent
 * Instance name is lanagent-<hostname>-<port>, with the hostname cut so the
 * instance and host names each fit one DNS label. The A record uses the
 * primary network address, or the hostname's address if there is none
 * @param hostname: Short hostname, without domain
 */
ServiceRecord makeServiceRecord(const AgentConfig& config, int port, const std::string& hostname,
                                const NetworkInterfaceInspector& inspector);

/**
 * ServiceAdvertiser publishes one DNS-SD record over multicast DNS
 * so clients can find the HTTP endpoint without knowing its address
 */
class ServiceAdvertiser {
private:
    int mdns_socket;               // UDP socket bound to 5353
    std::atomic<bool> is_listening;
    std::thread listen_thread;
    ServiceRecord record;

    /**
     * Answer queries until stop() is called
     * Sends the second announcement once the first second has passed
     */
    void listenLoop();

    /**
     * Send a packet to the mDNS group
     */
    bool sendMulticast(const std::vector<uint8_t>& packet);

public:
    explicit ServiceAdvertiser(const ServiceRecord& record);
    ~ServiceAdvertiser();

    /**
     * Open the multicast socket, announce the service and start answering
     * @return: false if the record cannot be encoded or the socket cannot be created or bound
     */
    bool start();

    /**
     * Send a goodbye and stop answering
     */
    void stop();

    const ServiceRecord& getRecord() const { return record; }
};
