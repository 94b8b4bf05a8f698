#ifndef GATEWAY_CHECKER_HPP
#define GATEWAY_CHECKER_HPP

#include "config.hpp"
#include "prober.hpp"
#include <string>
#include <vector>

class GatewayChecker {
public:
    GatewayChecker(Prober &prober, const Config &config);

    /**
     * @brief Find the first candidate answering an ARP request
     *
     * Candidates are tried in order, each with a single probe.
     *
     * @param candidates gateway addresses, preferred first
     * @param timeout_ms timeout of each probe
     * @param gateway set to the first reachable candidate
     * @return false if no candidate answered
     */
    bool findReachable(const std::vector<std::string> &candidates,
                       unsigned int timeout_ms,
                       std::string &gateway);

    /* Same, with the gateways and timeout from the configuration */
    bool findReachable(std::string &gateway);

private:
    Prober &m_prober;
    const Config &m_config;
};

#endif
