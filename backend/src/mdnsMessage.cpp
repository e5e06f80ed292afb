#include "mdnsMessage.hpp"
#include <cctype>
#include <algorithm>
#include <arpa/inet.h>

namespace {

const uint16_t FLAGS_AUTHORITATIVE_RESPONSE = 0x8400;
const uint16_t CLASS_IN = 0x0001;
const uint16_t CLASS_CACHE_FLUSH = 0x8000;    // Unique records (SRV, TXT, A)
const uint16_t QU_BIT = 0x8000;
const int MAX_POINTER_JUMPS = 16;

void push16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value >> 8));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void push32(std::vector<uint8_t>& out, uint32_t value) {
    push16(out, static_cast<uint16_t>(value >> 16));
    push16(out, static_cast<uint16_t>(value & 0xFFFF));
}

uint16_t read16(const uint8_t* p) {
    return static_cast<uint16_t>((p[0] << 8) | p[1]);
}

void pushHeader(std::vector<uint8_t>& out, uint16_t id, uint16_t questions, uint16_t answers) {
    push16(out, id);
    push16(out, FLAGS_AUTHORITATIVE_RESPONSE);
    push16(out, questions);
    push16(out, answers);
    push16(out, 0);         // authority
    push16(out, 0);         // additional
}

/**
 * Append one resource record
 * @return: false if the owner name cannot be encoded, out is left unchanged
 */
bool pushRecord(std::vector<uint8_t>& out, const std::string& name, uint16_t type,
                uint16_t rrclass, uint32_t ttl, const std::vector<uint8_t>& rdata) {
    std::vector<uint8_t> encoded = encodeName(name);
    if (encoded.empty()) {
        return false;
    }
    out.insert(out.end(), encoded.begin(), encoded.end());
    push16(out, type);
    push16(out, rrclass);
    push32(out, ttl);
    push16(out, static_cast<uint16_t>(rdata.size()));
    out.insert(out.end(), rdata.begin(), rdata.end());
    return true;
}

/**
 * PTR, SRV, TXT and A records of the service, appended to out
 * @return: Number of records written, 0 if a name does not fit in DNS labels
 */
uint16_t pushServiceRecords(std::vector<uint8_t>& out, const ServiceRecord& record, uint32_t ttl) {
    std::string instance = record.instanceFqdn();
    std::vector<uint8_t> instance_name = encodeName(instance);
    std::vector<uint8_t> target = encodeName(record.host_name);
    if (instance_name.empty() || target.empty()) {
        return 0;
    }

    std::vector<uint8_t> records;
    if (!pushRecord(records, record.service_type, DNS_TYPE_PTR, CLASS_IN, ttl, instance_name)) {
        return 0;
    }

    std::vector<uint8_t> srv;
    push16(srv, 0);         // priority
    push16(srv, 0);         // weight
    push16(srv, record.port);
    srv.insert(srv.end(), target.begin(), target.end());
    pushRecord(records, instance, DNS_TYPE_SRV, CLASS_IN | CLASS_CACHE_FLUSH, ttl, srv);

    std::vector<uint8_t> txt;
    for (const auto& entry : record.txt) {
        std::string pair = entry.first + "=" + entry.second;
        if (pair.size() > 255) continue;
        txt.push_back(static_cast<uint8_t>(pair.size()));
        txt.insert(txt.end(), pair.begin(), pair.end());
    }
    if (txt.empty()) {
        txt.push_back(0);
    }
    pushRecord(records, instance, DNS_TYPE_TXT, CLASS_IN | CLASS_CACHE_FLUSH, ttl, txt);

    uint16_t count = 3;
    struct in_addr addr;
    if (inet_pton(AF_INET, record.ipv4.c_str(), &addr) == 1) {
        const uint8_t* bytes = (const uint8_t*)&addr.s_addr;
        std::vector<uint8_t> a(bytes, bytes + 4);
        pushRecord(records, record.host_name, DNS_TYPE_A, CLASS_IN | CLASS_CACHE_FLUSH, ttl, a);
        count++;
    }

    out.insert(out.end(), records.begin(), records.end());
    return count;
}

/**
 * Decode a possibly compressed name starting at offset
 * @param next: Offset just past the name where it started, before any pointer jump
 */
bool readName(const uint8_t* data, size_t length, size_t offset, std::string& name, size_t& next) {
    name.clear();
    bool jumped = false;
    int jumps = 0;

    while (true) {
        if (offset >= length) return false;
        uint8_t label_len = data[offset];

        if (label_len == 0) {
            if (!jumped) next = offset + 1;
            return true;
        }

        if ((label_len & 0xC0) == 0xC0) {
            if (offset + 1 >= length || ++jumps > MAX_POINTER_JUMPS) return false;
            if (!jumped) next = offset + 2;
            offset = static_cast<size_t>(((label_len & 0x3F) << 8) | data[offset + 1]);
            jumped = true;
            continue;
        }

        if ((label_len & 0xC0) != 0 || offset + 1 + label_len > length) return false;

        if (!name.empty()) name.push_back('.');
        name.append((const char*)(data + offset + 1), label_len);
        offset += 1 + label_len;
    }
}

bool typeMatches(uint16_t asked, uint16_t published) {
    return asked == published || asked == DNS_TYPE_ANY;
}

/**
 * Answers for the questions that concern this record
 * @return: Number of records written to out
 */
uint16_t pushAnswers(std::vector<uint8_t>& out, const ServiceRecord& record,
                     const std::vector<DnsQuestion>& questions, uint32_t ttl) {
    std::string service = canonicalName(record.service_type);
    std::string instance = canonicalName(record.instanceFqdn());
    std::string host = canonicalName(record.host_name);
    std::string services = canonicalName(DNS_SD_SERVICES);

    bool answer_service = false;
    bool answer_enumeration = false;

    for (const auto& question : questions) {
        if (question.name == services && typeMatches(question.type, DNS_TYPE_PTR)) {
            answer_enumeration = true;
        } else if (question.name == service && typeMatches(question.type, DNS_TYPE_PTR)) {
            answer_service = true;
        } else if (question.name == instance &&
                   (typeMatches(question.type, DNS_TYPE_SRV) || typeMatches(question.type, DNS_TYPE_TXT))) {
            answer_service = true;
        } else if (question.name == host && typeMatches(question.type, DNS_TYPE_A)) {
            answer_service = true;
        }
    }

    uint16_t count = 0;
    if (answer_enumeration &&
        pushRecord(out, DNS_SD_SERVICES, DNS_TYPE_PTR, CLASS_IN, ttl, encodeName(record.service_type))) {
        count++;
    }
    if (answer_service) {
        count += pushServiceRecords(out, record, ttl);
    }
    return count;
}

} // namespace

std::string ServiceRecord::instanceFqdn() const {
    return instance_name + "." + service_type;
}

std::string canonicalName(const std::string& name) {
    size_t n = name.size();
    while (n > 0 && name[n - 1] == '.') {
        n--;
    }
    std::string out;
    out.reserve(n);
    for (size_t i = 0; i < n; i++) {
        out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(name[i]))));
    }
    return out;
}

std::vector<uint8_t> encodeName(const std::string& fqdn) {
    std::vector<uint8_t> encoded;
    size_t start = 0;
    for (size_t i = 0; i <= fqdn.size(); i++) {
        if (i == fqdn.size() || fqdn[i] == '.') {
            std::string label = fqdn.substr(start, i - start);
            if (label.size() > MAX_LABEL_LENGTH) return {};
            if (!label.empty()) {
                encoded.push_back(static_cast<uint8_t>(label.size()));
                encoded.insert(encoded.end(), label.begin(), label.end());
            }
            start = i + 1;
        }
    }
    encoded.push_back(0);
    return encoded;
}

std::vector<uint8_t> buildAnnouncement(const ServiceRecord& record, uint32_t ttl) {
    std::vector<uint8_t> records;
    uint16_t count = pushServiceRecords(records, record, ttl);
    if (count == 0) {
        return {};
    }

    std::vector<uint8_t> packet;
    pushHeader(packet, 0, 0, count);
    packet.insert(packet.end(), records.begin(), records.end());
    return packet;
}

std::vector<uint8_t> buildResponse(const ServiceRecord& record,
                                   const std::vector<DnsQuestion>& questions, uint32_t ttl) {
    std::vector<uint8_t> records;
    uint16_t count = pushAnswers(records, record, questions, ttl);
    if (count == 0) {
        return {};
    }

    std::vector<uint8_t> packet;
    pushHeader(packet, 0, 0, count);
    packet.insert(packet.end(), records.begin(), records.end());
    return packet;
}

std::vector<uint8_t> buildLegacyResponse(const ServiceRecord& record,
                                         const std::vector<DnsQuestion>& questions,
                                         uint16_t id, uint32_t ttl) {
    std::vector<uint8_t> records;
    uint16_t count = pushAnswers(records, record, questions, std::min(ttl, LEGACY_UNICAST_TTL));
    if (count == 0) {
        return {};
    }

    // Legacy resolvers match the reply on the id and the echoed questions
    std::vector<uint8_t> echoed;
    uint16_t question_count = 0;
    for (const auto& question : questions) {
        std::vector<uint8_t> name = encodeName(question.name);
        if (name.empty()) continue;
        echoed.insert(echoed.end(), name.begin(), name.end());
        push16(echoed, question.type);
        push16(echoed, CLASS_IN);
        question_count++;
    }

    std::vector<uint8_t> packet;
    pushHeader(packet, id, question_count, count);
    packet.insert(packet.end(), echoed.begin(), echoed.end());
    packet.insert(packet.end(), records.begin(), records.end());
    return packet;
}

bool wantsUnicastResponse(const std::vector<DnsQuestion>& questions) {
    for (const auto& question : questions) {
        if (question.unicast_response) return true;
    }
    return false;
}

bool parseQuery(const uint8_t* data, size_t length, uint16_t& id, std::vector<DnsQuestion>& questions) {
    questions.clear();
    if (length < 12) return false;

    id = read16(data);
    uint16_t flags = read16(data + 2);
    if (flags & 0x8000) return false;           // QR set: a response, not a query

    uint16_t question_count = read16(data + 4);
    size_t offset = 12;

    for (uint16_t i = 0; i < question_count; i++) {
        DnsQuestion question;
        std::string name;
        size_t next = 0;
        if (!readName(data, length, offset, name, next) || next + 4 > length) {
            return false;
        }

        question.name = canonicalName(name);
        question.type = read16(data + next);
        question.unicast_response = (read16(data + next + 2) & QU_BIT) != 0;
        questions.push_back(question);
        offset = next + 4;
    }

    return true;
}
