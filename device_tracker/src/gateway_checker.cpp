#include "gateway_checker.hpp"
#include "logger.hpp"
#include <sstream>

GatewayChecker::GatewayChecker(Prober &prober, const Config &config):
m_prober(prober),
m_config(config)
{

}

bool GatewayChecker::findReachable(const std::vector<std::string> &candidates,
                                   unsigned int timeout_ms,
                                   std::string &gateway)
{
    for (auto &candidate : candidates) {
        Logger::debug("Testing gateway " + candidate);

        if (!m_prober.probe(candidate, timeout_ms).empty()) {
            Logger::debug("Gateway " + candidate + " is reachable");
            gateway = candidate;
            return true;
        }

        Logger::debug("Gateway " + candidate + " is not reachable");
    }

    std::stringstream ss;
    ss << "None of the gateways";
    for (auto &candidate : candidates)
        ss << ' ' << candidate;
    ss << " are reachable";
    Logger::warn(ss.str());

    return false;
}

bool GatewayChecker::findReachable(std::string &gateway)
{
    return findReachable(m_config.gateways, m_config.gateway_timeout_ms, gateway);
}
