#include "arp_prober.hpp"
#include "address_range.hpp"
#include "logger.hpp"
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <ifaddrs.h>
#include <linux/if_ether.h>
#include <linux/if_packet.h>
#include <net/ethernet.h>
#include <net/if.h>
#include <net/if_arp.h>
#include <netinet/in.h>
#include <poll.h>
#include <set>
#include <sstream>
#include <stdexcept>
#include <sys/ioctl.h>
#include <sys/socket.h>
#include <sys/types.h>
#include <unistd.h>

struct __attribute__((packed)) arp_frame_t {
    /* Ethernet header */
    uint8_t dst_mac[6];
    uint8_t src_mac[6];
    uint16_t ethertype;

    /* ARP payload for IPv4 over Ethernet */
    uint16_t htype;
    uint16_t ptype;
    uint8_t hlen;
    uint8_t plen;
    uint16_t oper;
    uint8_t sha[6];
    uint8_t spa[4];
    uint8_t tha[6];
    uint8_t tpa[4];
};

namespace {

std::string find_default_interface()
{
    struct ifaddrs *ifaddr;
    if (getifaddrs(&ifaddr) < 0)
        return std::string();

    std::string name;
    for (struct ifaddrs *ifa = ifaddr; ifa; ifa = ifa->ifa_next) {
        if (!ifa->ifa_addr || ifa->ifa_addr->sa_family != AF_INET)
            continue;
        if (!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK))
            continue;

        name = ifa->ifa_name;
        break;
    }

    freeifaddrs(ifaddr);
    return name;
}

void fail(int &fd, const std::string &msg)
{
    if (fd >= 0) {
        close(fd);
        fd = -1;
    }
    Logger::err(msg);
    throw std::runtime_error(msg);
}

}

ArpProber::ArpProber(const std::string &interface):
m_interface(interface),
m_fd(-1),
m_ifindex(0),
m_mac(),
m_address(0)
{

}

void ArpProber::open()
{
    if (m_fd >= 0)
        return;

    if (m_interface.empty())
        m_interface = find_default_interface();
    if (m_interface.empty())
        fail(m_fd, "No network interface available for ARP");
    if (m_interface.length() >= IFNAMSIZ)
        fail(m_fd, "Invalid interface name " + m_interface);

    m_fd = socket(AF_PACKET, SOCK_RAW, htons(ETH_P_ARP));
    if (m_fd < 0) {
        std::stringstream ss;
        ss << "Failed to create ARP socket: " << strerror(errno);
        fail(m_fd, ss.str());
    }

    struct ifreq ifr;
    memset(&ifr, 0, sizeof(ifr));
    strncpy(ifr.ifr_name, m_interface.c_str(), IFNAMSIZ - 1);

    if (ioctl(m_fd, SIOCGIFINDEX, &ifr) < 0)
        fail(m_fd, "Failed to get index of interface " + m_interface);
    m_ifindex = ifr.ifr_ifindex;

    if (ioctl(m_fd, SIOCGIFHWADDR, &ifr) < 0)
        fail(m_fd, "Failed to get MAC address of interface " + m_interface);
    memcpy(m_mac.data(), ifr.ifr_hwaddr.sa_data, m_mac.size());

    if (ioctl(m_fd, SIOCGIFADDR, &ifr) < 0)
        fail(m_fd, "Failed to get IPv4 address of interface " + m_interface);
    m_address = ntohl(reinterpret_cast<struct sockaddr_in*>(&ifr.ifr_addr)->sin_addr.s_addr);

    struct sockaddr_ll sll;
    memset(&sll, 0, sizeof(sll));
    sll.sll_family = AF_PACKET;
    sll.sll_protocol = htons(ETH_P_ARP);
    sll.sll_ifindex = m_ifindex;
    if (bind(m_fd, reinterpret_cast<struct sockaddr*>(&sll), sizeof(sll)) < 0)
        fail(m_fd, "Failed to bind ARP socket to " + m_interface);

    std::stringstream ss;
    ss << "ARP requests sent on " << m_interface << " (IP: " << ipv4_to_string(m_address)
       << ", MAC: " << mac_to_string(m_mac) << ')';
    Logger::debug(ss.str());
}

ArpProber::~ArpProber()
{
    if (m_fd >= 0)
        close(m_fd);
}

Snapshot ArpProber::probe(const std::string &address, unsigned int timeout_ms)
{
    uint32_t target;
    if (!parse_ipv4(address, target)) {
        Logger::err("Invalid IPv4 address " + address);
        return Snapshot();
    }

    Logger::debug("Sending ARP request to " + address);
    Snapshot devices = probeAddresses(std::vector<uint32_t>(1, target), timeout_ms);
    if (devices.empty())
        Logger::debug("No response from " + address);
    else
        Logger::debug("Received response from " + address);

    return devices;
}

Snapshot ArpProber::probeRange(const std::string &range, unsigned int timeout_ms)
{
    std::vector<uint32_t> targets;
    if (!expand_range(range, targets)) {
        Logger::err("Invalid address range " + range);
        return Snapshot();
    }

    Logger::debug("Scanning IP range " + range);
    Snapshot devices = probeAddresses(targets, timeout_ms);

    std::stringstream ss;
    ss << "Found " << devices.size() << " devices in the range " << range;
    Logger::debug(ss.str());

    return devices;
}

bool ArpProber::sendRequest(uint32_t target)
{
    struct arp_frame_t frame;
    memset(&frame, 0, sizeof(frame));
    memset(frame.dst_mac, 0xFF, sizeof(frame.dst_mac));
    memcpy(frame.src_mac, m_mac.data(), m_mac.size());
    frame.ethertype = htons(ETH_P_ARP);
    frame.htype = htons(ARPHRD_ETHER);
    frame.ptype = htons(ETH_P_IP);
    frame.hlen = 6;
    frame.plen = 4;
    frame.oper = htons(ARPOP_REQUEST);
    memcpy(frame.sha, m_mac.data(), m_mac.size());

    uint32_t spa = htonl(m_address);
    uint32_t tpa = htonl(target);
    memcpy(frame.spa, &spa, sizeof(frame.spa));
    memcpy(frame.tpa, &tpa, sizeof(frame.tpa));

    struct sockaddr_ll sll;
    memset(&sll, 0, sizeof(sll));
    sll.sll_family = AF_PACKET;
    sll.sll_protocol = htons(ETH_P_ARP);
    sll.sll_ifindex = m_ifindex;
    sll.sll_halen = 6;
    memset(sll.sll_addr, 0xFF, 6);

    ssize_t ret = sendto(m_fd, &frame, sizeof(frame), 0,
                         reinterpret_cast<struct sockaddr*>(&sll), sizeof(sll));
    if (ret != static_cast<ssize_t>(sizeof(frame))) {
        std::stringstream ss;
        ss << "Failed to send ARP request for " << ipv4_to_string(target) << ": " << strerror(errno);
        Logger::warn(ss.str());
        return false;
    }

    return true;
}

Snapshot ArpProber::probeAddresses(const std::vector<uint32_t> &addresses, unsigned int timeout_ms)
{
    open();

    Snapshot devices;
    std::set<uint32_t> pending;

    for (auto a : addresses) {
        if (sendRequest(a))
            pending.insert(a);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms);
    while (!pending.empty()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline)
            break;

        int remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
        struct pollfd fds;
        fds.fd = m_fd;
        fds.events = POLLIN;
        fds.revents = 0;

        int ret = poll(&fds, 1, remaining);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            std::stringstream ss;
            ss << "Failed to poll ARP socket: " << strerror(errno);
            Logger::err(ss.str());
            break;
        }
        if (ret == 0)
            break;

        uint8_t buffer[1500];
        ssize_t len = recv(m_fd, buffer, sizeof(buffer), 0);
        if (len < 0) {
            if (errno == EINTR)
                continue;
            std::stringstream ss;
            ss << "Failed to read ARP socket: " << strerror(errno);
            Logger::err(ss.str());
            break;
        }
        if (len < static_cast<ssize_t>(sizeof(arp_frame_t)))
            continue;

        struct arp_frame_t frame;
        memcpy(&frame, buffer, sizeof(frame));
        if (ntohs(frame.ethertype) != ETH_P_ARP
        ||  ntohs(frame.ptype) != ETH_P_IP
        ||  ntohs(frame.oper) != ARPOP_REPLY)
            continue;

        uint32_t spa;
        memcpy(&spa, frame.spa, sizeof(spa));
        spa = ntohl(spa);

        /* Only the first reply of each target counts */
        if (pending.erase(spa) == 0)
            continue;

        MacAddress mac;
        memcpy(mac.data(), frame.sha, mac.size());

        Device d;
        d.address = ipv4_to_string(spa);
        d.hw_address = mac_to_string(mac);
        devices.push_back(d);

        Logger::debug(d.hw_address + " " + d.address);
    }

    return devices;
}
