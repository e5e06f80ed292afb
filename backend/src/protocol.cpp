#include "protocol.hpp"
#include <algorithm>
#include <cctype>
#include <nlohmann/json.hpp>

using ordered_json = nlohmann::ordered_json;

/**
 * Validate MAC address format
 * arp prints "(incomplete)" and some tools "<incomplete>" for unresolved entries
 */
bool isValidMac(const std::string& mac) {
    if (mac == "(incomplete)" || mac == "<incomplete>") {
        return false;
    }

    int parts = 0;
    size_t start = 0;
    while (true) {
        size_t end = mac.find(':', start);
        std::string part = mac.substr(start, end == std::string::npos ? std::string::npos : end - start);

        if (part.size() != 2) return false;
        for (char c : part) {
            if (!std::isxdigit(static_cast<unsigned char>(c))) return false;
        }
        parts++;

        if (end == std::string::npos) break;
        start = end + 1;
    }

    return parts == 6;
}

std::string normalizeMac(const std::string& mac) {
    std::string upper = mac;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return upper;
}

/**
 * Serialize the cached devices for the HTTP response
 * ordered_json keeps the keys in insertion order (status, count, devices)
 */
ordered_json makeScanResponse(const ScanResult& devices) {
    ordered_json j;
    j["status"] = "success";
    j["count"] = devices.size();
    j["devices"] = ordered_json::array();
    for (const auto& device : devices) {
        j["devices"].push_back(ordered_json{{"ip", device.ip}, {"mac", device.mac}});
    }
    return j;
}
