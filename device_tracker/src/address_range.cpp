#include "address_range.hpp"
#include <arpa/inet.h>
#include <cctype>
#include <netinet/in.h>
#include <string>

#define MIN_PREFIX_LENGTH   (16)

namespace {

bool parse_number(const std::string &str, unsigned int max, unsigned int &value)
{
    if (str.empty() || str.length() > 5)
        return false;

    for (unsigned int i = 0; i < str.length(); ++i) {
        if (!std::isdigit(static_cast<unsigned char>(str[i])))
            return false;
    }

    value = std::stoul(str);
    return value <= max;
}

}

bool parse_ipv4(const std::string &str, uint32_t &address)
{
    struct in_addr addr;
    if (inet_pton(AF_INET, str.c_str(), &addr) != 1)
        return false;

    address = ntohl(addr.s_addr);
    return true;
}

std::string ipv4_to_string(uint32_t address)
{
    char buf[INET_ADDRSTRLEN];
    struct in_addr addr;
    addr.s_addr = htonl(address);
    if (!inet_ntop(AF_INET, &addr, buf, sizeof(buf)))
        return std::string();

    return buf;
}

bool expand_range(const std::string &range, std::vector<uint32_t> &addresses)
{
    addresses.clear();

    size_t slash = range.find('/');
    if (slash != std::string::npos) {
        uint32_t base;
        unsigned int prefix;
        if (!parse_ipv4(range.substr(0, slash), base)
        ||  !parse_number(range.substr(slash + 1), 32, prefix)
        ||  prefix < MIN_PREFIX_LENGTH)
            return false;

        uint32_t mask = 0xFFFFFFFFU << (32 - prefix);
        uint32_t first = base & mask;
        uint64_t count = 1ULL << (32 - prefix);
        for (uint64_t i = 0; i < count; ++i)
            addresses.push_back(first + static_cast<uint32_t>(i));

        return true;
    }

    size_t dash = range.find('-');
    if (dash != std::string::npos) {
        uint32_t first;
        unsigned int last_octet;
        if (!parse_ipv4(range.substr(0, dash), first)
        ||  !parse_number(range.substr(dash + 1), 255, last_octet))
            return false;

        if (last_octet < (first & 0xFF))
            return false;

        uint32_t last = (first & 0xFFFFFF00U) | last_octet;
        for (uint32_t a = first; a <= last; ++a)
            addresses.push_back(a);

        return true;
    }

    uint32_t address;
    if (!parse_ipv4(range, address))
        return false;

    addresses.push_back(address);
    return true;
}
