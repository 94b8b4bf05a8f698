#ifndef DEVICE_HPP
#define DEVICE_HPP

#include <array>
#include <cstdint>
#include <string>
#include <time.h>
#include <vector>

typedef std::array<uint8_t, 6> MacAddress;

/* One (IP, MAC) pair answering an ARP request */
struct Device {
    std::string address;
    std::string hw_address;     /* lowercase, colon separated */
};

typedef std::vector<Device> Snapshot;

struct FavouriteRecord {
    std::string name;
    std::string address;
    std::string hw_address;
    time_t last_seen;
};

bool operator==(const Device &a, const Device &b);
bool operator==(const FavouriteRecord &a, const FavouriteRecord &b);

std::string mac_to_string(const MacAddress &mac);

/*
 * Convert a user supplied MAC address to the canonical form,
 * e.g. "AA-BB-CC-DD-EE-01" -> "aa:bb:cc:dd:ee:01".
 * Returns false if str is not a MAC address.
 */
bool normalize_mac(const std::string &str, std::string &mac);

/* "%Y-%m-%d %H:%M:%S" in local time */
std::string format_timestamp(time_t timestamp);

#endif
