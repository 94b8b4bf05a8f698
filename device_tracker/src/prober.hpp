#ifndef PROBER_HPP
#define PROBER_HPP

#include "device.hpp"
#include <string>

/*
 * Address resolution requests.
 *
 * Hosts that do not answer within the timeout are simply absent
 * from the returned snapshot, a timeout is not an error.
 */
class Prober {
public:
    virtual ~Prober() = default;

    /**
     * @brief Resolve a single IPv4 address
     *
     * @param address dotted quad
     * @param timeout_ms how long to wait for replies
     * @return devices that answered, empty if none
     */
    virtual Snapshot probe(const std::string &address, unsigned int timeout_ms) = 0;

    /**
     * @brief Resolve every address of a range
     *
     * @param range a.b.c.d, a.b.c.d/n or a.b.c.d-e
     * @param timeout_ms how long to wait for replies
     * @return devices that answered, empty if none
     */
    virtual Snapshot probeRange(const std::string &range, unsigned int timeout_ms) = 0;
};

#endif
