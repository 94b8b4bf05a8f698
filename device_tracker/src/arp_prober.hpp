#ifndef ARP_PROBER_HPP
#define ARP_PROBER_HPP

#include "device.hpp"
#include "prober.hpp"
#include <cstdint>
#include <string>
#include <vector>

/*
 * Prober sending broadcast ARP requests on a raw AF_PACKET socket.
 * Requires CAP_NET_RAW.
 */
class ArpProber : public Prober {
public:
    /**
     * @param interface interface name, or empty string to use the
     * first interface that is up, not loopback and has an IPv4 address.
     */
    explicit ArpProber(const std::string &interface = std::string());
    virtual ~ArpProber();

    /**
     * @brief Open the raw socket, done by the first probe otherwise
     *
     * @throw std::runtime_error if the socket cannot be set up
     */
    void open();

    ArpProber(const ArpProber&) = delete;
    ArpProber& operator=(const ArpProber&) = delete;

    virtual Snapshot probe(const std::string &address, unsigned int timeout_ms);
    virtual Snapshot probeRange(const std::string &range, unsigned int timeout_ms);

private:
    Snapshot probeAddresses(const std::vector<uint32_t> &addresses, unsigned int timeout_ms);
    bool sendRequest(uint32_t target);

    std::string m_interface;
    int m_fd;
    int m_ifindex;
    MacAddress m_mac;
    uint32_t m_address;
};

#endif
