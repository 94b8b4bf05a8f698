#ifndef MATCHER_HPP
#define MATCHER_HPP

#include "device.hpp"
#include <string>

enum MatchState {
    MATCH_NONE,         /* neither the IP nor the MAC is seen */
    MATCH_IP_MOVED,     /* the MAC answers from another IP */
    MATCH_MAC_MOVED,    /* the IP is held by another MAC */
    MATCH_CONFLICT,     /* both of the above */
    MATCH_EXACT,
};

struct MatchResult {
    MatchState state;
    std::string observed_address;       /* IP of the MAC, if it moved */
    std::string observed_hw_address;    /* MAC holding the IP, if it changed */
};

const char* match_state_str(MatchState state);

/*
 * Classify a favourite against a snapshot.
 *
 * The whole snapshot is searched for an exact (IP, MAC) pair first.
 * Partial matches use the first device in scan order.
 */
MatchResult classify(const std::string &address,
                     const std::string &hw_address,
                     const Snapshot &snapshot);

/* Return the first device with that IP, or nullptr */
const Device* find_by_address(const std::string &address, const Snapshot &snapshot);

/* Return the first device with that MAC, or nullptr */
const Device* find_by_hw_address(const std::string &hw_address, const Snapshot &snapshot);

#endif
