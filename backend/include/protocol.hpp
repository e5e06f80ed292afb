//this header file defines the records exchanged between the scanner and the HTTP layer
#pragma once
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

/**
 * One host seen on the local network
 * mac is always uppercase, colon separated (AA:BB:CC:DD:EE:FF)
 */
struct Device {
	std::string ip;
	std::string mac;
};

inline bool operator==(const Device& a, const Device& b) {
	return a.ip == b.ip && a.mac == b.mac;
}

/**
 * Address and netmask of the primary IPv4 interface
 */
struct NetworkInfo {
	std::string ip;
	std::string netmask;
};

// Devices in discovery order
typedef std::vector<Device> ScanResult;

/**
 * Checks that a string is a hardware address of the form xx:xx:xx:xx:xx:xx
 * The incomplete markers printed by arp / ip neigh are rejected
 */
bool isValidMac(const std::string& mac);

// Uppercases a MAC address
std::string normalizeMac(const std::string& mac);

/**
 * Builds the body returned by GET /scan
 * {"status":"success","count":N,"devices":[{"ip":..,"mac":..},...]}
 */
nlohmann::ordered_json makeScanResponse(const ScanResult& devices);
