#include "device.hpp"
#include <cctype>
#include <cstdio>
#include <string>

bool operator==(const Device &a, const Device &b)
{
    return a.address == b.address && a.hw_address == b.hw_address;
}

bool operator==(const FavouriteRecord &a, const FavouriteRecord &b)
{
    return a.name == b.name
        && a.address == b.address
        && a.hw_address == b.hw_address
        && a.last_seen == b.last_seen;
}

std::string mac_to_string(const MacAddress &mac)
{
    char buf[32];
    snprintf(buf, sizeof(buf), "%02x:%02x:%02x:%02x:%02x:%02x",
             mac[0],
             mac[1],
             mac[2],
             mac[3],
             mac[4],
             mac[5]);
    return buf;
}

bool normalize_mac(const std::string &str, std::string &mac)
{
    /* xx:xx:xx:xx:xx:xx */
    if (str.length() != 17)
        return false;

    std::string out(str);
    for (unsigned int i = 0; i < out.length(); ++i) {
        if (i % 3 == 2) {
            if (out[i] != ':' && out[i] != '-')
                return false;
            out[i] = ':';
        } else {
            if (!std::isxdigit(static_cast<unsigned char>(out[i])))
                return false;
            out[i] = std::tolower(static_cast<unsigned char>(out[i]));
        }
    }

    mac = out;
    return true;
}

std::string format_timestamp(time_t timestamp)
{
    char buffer[64];
    struct tm t;
    if (!localtime_r(&timestamp, &t))
        return "unknown";

    strftime(buffer, sizeof(buffer), "%Y-%m-%d %H:%M:%S", &t);
    return buffer;
}
