#include "matcher.hpp"

const char* match_state_str(MatchState state)
{
    switch (state) {
    case MATCH_NONE:
        return "none";
    case MATCH_IP_MOVED:
        return "ip moved";
    case MATCH_MAC_MOVED:
        return "mac moved";
    case MATCH_CONFLICT:
        return "conflict";
    case MATCH_EXACT:
        return "exact";
    }

    return "unknown";
}

const Device* find_by_address(const std::string &address, const Snapshot &snapshot)
{
    for (auto &d : snapshot) {
        if (d.address == address)
            return &d;
    }

    return nullptr;
}

const Device* find_by_hw_address(const std::string &hw_address, const Snapshot &snapshot)
{
    for (auto &d : snapshot) {
        if (d.hw_address == hw_address)
            return &d;
    }

    return nullptr;
}

MatchResult classify(const std::string &address,
                     const std::string &hw_address,
                     const Snapshot &snapshot)
{
    MatchResult result;
    result.state = MATCH_NONE;

    for (auto &d : snapshot) {
        if (d.address == address && d.hw_address == hw_address) {
            result.state = MATCH_EXACT;
            return result;
        }
    }

    const Device *ip_match = find_by_address(address, snapshot);
    const Device *mac_match = find_by_hw_address(hw_address, snapshot);

    if (ip_match)
        result.observed_hw_address = ip_match->hw_address;
    if (mac_match)
        result.observed_address = mac_match->address;

    if (ip_match && mac_match)
        result.state = MATCH_CONFLICT;
    else if (ip_match)
        result.state = MATCH_MAC_MOVED;
    else if (mac_match)
        result.state = MATCH_IP_MOVED;

    return result;
}
