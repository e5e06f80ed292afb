#pragma once

#include <string>
#include <vector>
#include <utility>
#include <cstdint>
#include <cstddef>

// DNS record types used by the advertiser
enum : uint16_t {
    DNS_TYPE_A = 1,
    DNS_TYPE_PTR = 12,
    DNS_TYPE_TXT = 16,
    DNS_TYPE_SRV = 33,
    DNS_TYPE_ANY = 255
};

const uint16_t MDNS_PORT = 5353;
const char* const MDNS_GROUP = "224.0.0.251";
const char* const DNS_SD_SERVICES = "_services._dns-sd._udp.local.";
const uint32_t LEGACY_UNICAST_TTL = 10;     // Cap for replies to one-shot resolvers
const size_t MAX_LABEL_LENGTH = 63;

/**
 * One DNS-SD service instance and the host it lives on
 */
struct ServiceRecord {
    std::string instance_name;     // lanagent-<host>-<port>
    std::string service_type;      // _lanagent._tcp.local.
    std::string host_name;         // <host>.local.
    std::string ipv4;              // Address published in the A record
    uint16_t port;
    std::vector<std::pair<std::string, std::string>> txt;

    // <instance_name>.<service_type>
    std::string instanceFqdn() const;
};

/**
 * A question read from an incoming mDNS packet
 */
struct DnsQuestion {
    std::string name;              // Lowercase, without trailing dot
    uint16_t type;
    bool unicast_response;         // QU bit
};

/**
 * Lowercase a DNS name and strip trailing dots
 */
std::string canonicalName(const std::string& name);

/**
 * Encode a dotted name as DNS labels
 * @return: Empty if a label is longer than MAX_LABEL_LENGTH bytes
 */
std::vector<uint8_t> encodeName(const std::string& fqdn);

/**
 * Unsolicited response carrying PTR, SRV, TXT and A records
 * @param ttl: Seconds; 0 produces a goodbye packet
 * @return: Empty if a name of the record does not fit in DNS labels
 */
std::vector<uint8_t> buildAnnouncement(const ServiceRecord& record, uint32_t ttl);

/**
 * Multicast answer for a set of questions
 * @return: Empty if no question concerns this record
 */
std::vector<uint8_t> buildResponse(const ServiceRecord& record,
                                   const std::vector<DnsQuestion>& questions, uint32_t ttl);

/**
 * Unicast answer to a resolver querying from a port other than 5353
 * Carries the query id and repeats the questions; TTLs are capped at LEGACY_UNICAST_TTL
 * @return: Empty if no question concerns this record
 */
std::vector<uint8_t> buildLegacyResponse(const ServiceRecord& record,
                                         const std::vector<DnsQuestion>& questions,
                                         uint16_t id, uint32_t ttl);

/**
 * True if any question has the QU bit set
 */
bool wantsUnicastResponse(const std::vector<DnsQuestion>& questions);

/**
 * Read the question section of a query
 * @return: false for responses and malformed packets
 */
bool parseQuery(const uint8_t* data, size_t length, uint16_t& id, std::vector<DnsQuestion>& questions);
