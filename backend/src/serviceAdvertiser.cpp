#include "serviceAdvertiser.hpp"
#include <iostream>
#include <cerrno>
#include <cstring>
#include <chrono>
#include <arpa/inet.h>
#include <sys/socket.h>
#include <netinet/in.h>
#include <net/if.h>       // For network interfaces
#include <ifaddrs.h>      // For getting network interface addresses
#include <netdb.h>
#include <unistd.h>

using namespace std::chrono_literals;

namespace {

const uint32_t RECORD_TTL = 120;

std::string shortHostname() {
    char hostname[256];
    if (gethostname(hostname, sizeof(hostname)) != 0) {
        std::cerr << "Failed to read hostname: " << strerror(errno) << std::endl;
        return "localhost";
    }
    hostname[sizeof(hostname) - 1] = '\0';

    std::string name(hostname);
    return name.substr(0, name.find('.'));
}

std::string resolveHostAddress(const std::string& hostname) {
    struct addrinfo hints;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;

    struct addrinfo* result = nullptr;
    if (getaddrinfo(hostname.c_str(), nullptr, &hints, &result) != 0 || result == nullptr) {
        return "";
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr = (struct sockaddr_in*)result->ai_addr;
    inet_ntop(AF_INET, &addr->sin_addr, ip_str, INET_ADDRSTRLEN);
    freeaddrinfo(result);
    return ip_str;
}

/**
 * Join 224.0.0.251 on every up, non-loopback, multicast capable IPv4 interface
 * @return: Number of memberships added
 */
int joinMulticastGroups(int socket_fd) {
    int joined = 0;
    struct ifaddrs* interfaces = nullptr;
    if (getifaddrs(&interfaces) != 0) {
        return joined;
    }

    for (struct ifaddrs* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET) continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;
        if (!(ifa->ifa_flags & IFF_MULTICAST)) continue;

        struct ip_mreq membership;
        membership.imr_multiaddr.s_addr = inet_addr(MDNS_GROUP);
        membership.imr_interface = ((struct sockaddr_in*)ifa->ifa_addr)->sin_addr;
        if (setsockopt(socket_fd, IPPROTO_IP, IP_ADD_MEMBERSHIP, &membership, sizeof(membership)) == 0) {
            joined++;
        }
    }

    freeifaddrs(interfaces);
    return joined;
}

} // namespace

ServiceRecord makeServiceRecord(const AgentConfig& config, int port,
                                const NetworkInterfaceInspector& inspector) {
    return makeServiceRecord(config, port, shortHostname(), inspector);
}

ServiceRecord makeServiceRecord(const AgentConfig& config, int port, const std::string& hostname,
                                const NetworkInterfaceInspector& inspector) {
    std::string prefix = "lanagent-";
    std::string suffix = "-" + std::to_string(port);

    // Each name must stay a single DNS label
    std::string instance_host = hostname.substr(0, MAX_LABEL_LENGTH - prefix.size() - suffix.size());
    std::string host_label = hostname.substr(0, MAX_LABEL_LENGTH);

    ServiceRecord record;
    record.instance_name = prefix + instance_host + suffix;
    record.service_type = config.service_type;
    record.host_name = host_label + ".local.";
    record.port = static_cast<uint16_t>(port);

    // Get actual network IP (not localhost)
    NetworkInfo network;
    if (inspector.getPrimaryNetwork(network)) {
        record.ipv4 = network.ip;
    } else {
        record.ipv4 = resolveHostAddress(hostname);
    }

    record.txt = {
        {"version", config.service_version},
        {"path", "/scan"},
        {"description", config.description},
        {"hostname", hostname}
    };
    return record;
}

ServiceAdvertiser::ServiceAdvertiser(const ServiceRecord& record)
    : mdns_socket(-1), is_listening(false), record(record) {}

ServiceAdvertiser::~ServiceAdvertiser() {
    stop();
    if (mdns_socket >= 0) close(mdns_socket);
}

bool ServiceAdvertiser::start() {
    if (is_listening) return true;

    std::vector<uint8_t> announcement = buildAnnouncement(record, RECORD_TTL);
    if (announcement.empty()) {
        std::cerr << "Cannot encode service record for " << record.instance_name
                  << ": name too long for DNS" << std::endl;
        return false;
    }

    mdns_socket = socket(AF_INET, SOCK_DGRAM, 0);
    if (mdns_socket < 0) {
        std::cerr << "Failed to create mDNS socket: " << strerror(errno) << std::endl;
        return false;
    }

    // Other responders (avahi, mDNSResponder) usually hold 5353 already
    int reuse = 1;
    setsockopt(mdns_socket, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse));
#ifdef SO_REUSEPORT
    setsockopt(mdns_socket, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse));
#endif

    struct sockaddr_in listen_addr;
    memset(&listen_addr, 0, sizeof(listen_addr));
    listen_addr.sin_family = AF_INET;
    listen_addr.sin_addr.s_addr = INADDR_ANY;  // Listen on all interfaces
    listen_addr.sin_port = htons(MDNS_PORT);

    if (bind(mdns_socket, (struct sockaddr*)&listen_addr, sizeof(listen_addr)) < 0) {
        std::cerr << "Failed to bind mDNS socket: " << strerror(errno) << std::endl;
        close(mdns_socket);
        mdns_socket = -1;
        return false;
    }

    if (joinMulticastGroups(mdns_socket) == 0) {
        std::cerr << "Warning: could not join the mDNS group on any interface" << std::endl;
    }

    unsigned char ttl = 255;
    setsockopt(mdns_socket, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl));

    struct in_addr iface;
    if (inet_pton(AF_INET, record.ipv4.c_str(), &iface) == 1) {
        setsockopt(mdns_socket, IPPROTO_IP, IP_MULTICAST_IF, &iface, sizeof(iface));
    }

    // Set timeout for recvfrom (1 second)
    struct timeval timeout;
    timeout.tv_sec = 1;
    timeout.tv_usec = 0;
    setsockopt(mdns_socket, SOL_SOCKET, SO_RCVTIMEO, &timeout, sizeof(timeout));

    if (!sendMulticast(announcement)) {
        std::cerr << "Failed to announce service: " << strerror(errno) << std::endl;
    }

    is_listening = true;
    listen_thread = std::thread(&ServiceAdvertiser::listenLoop, this);

    std::cout << "Service registered via Zeroconf as: " << record.instance_name << std::endl;
    std::cout << "Service type: " << record.service_type << std::endl;
    std::cout << "IP address: " << record.ipv4 << std::endl;
    return true;
}

void ServiceAdvertiser::stop() {
    if (!is_listening) return;

    is_listening = false;
    if (listen_thread.joinable()) {
        listen_thread.join();
    }

    if (!sendMulticast(buildAnnouncement(record, 0))) {
        std::cerr << "Failed to send mDNS goodbye: " << strerror(errno) << std::endl;
    }

    close(mdns_socket);
    mdns_socket = -1;
    std::cout << "Service unregistered: " << record.instance_name << std::endl;
}

bool ServiceAdvertiser::sendMulticast(const std::vector<uint8_t>& packet) {
    struct sockaddr_in group_addr;
    memset(&group_addr, 0, sizeof(group_addr));
    group_addr.sin_family = AF_INET;
    group_addr.sin_port = htons(MDNS_PORT);
    group_addr.sin_addr.s_addr = inet_addr(MDNS_GROUP);

    ssize_t sent = sendto(mdns_socket, packet.data(), packet.size(), 0,
                          (struct sockaddr*)&group_addr, sizeof(group_addr));
    return sent == static_cast<ssize_t>(packet.size());
}

void ServiceAdvertiser::listenLoop() {
    uint8_t buffer[9000];
    bool reannounced = false;
    auto started = std::chrono::steady_clock::now();

    while (is_listening) {
        if (!reannounced && std::chrono::steady_clock::now() - started >= 1s) {
            if (!sendMulticast(buildAnnouncement(record, RECORD_TTL))) {
                std::cerr << "Failed to announce service: " << strerror(errno) << std::endl;
            }
            reannounced = true;
        }

        struct sockaddr_in sender_addr;
        socklen_t sender_len = sizeof(sender_addr);
        ssize_t received = recvfrom(mdns_socket, buffer, sizeof(buffer), 0,
                                    (struct sockaddr*)&sender_addr, &sender_len);
        if (received <= 0) {
            continue;
        }

        uint16_t id = 0;
        std::vector<DnsQuestion> questions;
        if (!parseQuery(buffer, static_cast<size_t>(received), id, questions)) {
            continue;
        }

        // Legacy unicast resolvers query from a random port and expect the id back
        bool legacy = ntohs(sender_addr.sin_port) != MDNS_PORT;
        std::vector<uint8_t> response = legacy ? buildLegacyResponse(record, questions, id, RECORD_TTL)
                                               : buildResponse(record, questions, RECORD_TTL);
        if (response.empty()) {
            continue;
        }

        if (legacy || wantsUnicastResponse(questions)) {
            if (sendto(mdns_socket, response.data(), response.size(), 0,
                       (struct sockaddr*)&sender_addr, sender_len) < 0) {
                std::cerr << "Failed to answer mDNS query: " << strerror(errno) << std::endl;
            }
        } else if (!sendMulticast(response)) {
            std::cerr << "Failed to answer mDNS query: " << strerror(errno) << std::endl;
        }
    }
}
