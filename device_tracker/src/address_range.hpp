#ifndef ADDRESS_RANGE_HPP
#define ADDRESS_RANGE_HPP

#include <cstdint>
#include <string>
#include <vector>

/* Addresses are in host byte order */
bool parse_ipv4(const std::string &str, uint32_t &address);
std::string ipv4_to_string(uint32_t address);

/*
 * Expand a range expression into the list of addresses it covers.
 *
 *  a.b.c.d         single address
 *  a.b.c.d/n       whole block, network and broadcast included (n >= 16)
 *  a.b.c.d-e       last octet from d to e
 *
 * Returns false if range is malformed.
 */
bool expand_range(const std::string &range, std::vector<uint32_t> &addresses);

#endif
