#pragma once
#include <string>
#include <optional>
#include <cstdint>

namespace lan_scan {

// IPv4 helpers; addresses are host byte order.
std::optional<uint32_t> parse_ipv4(const std::string& text);
std::string format_ipv4(uint32_t addr);
uint32_t prefix_to_mask(int prefix);
// Counts set bits across the four octets; nullopt for malformed or
// non-contiguous masks.
std::optional<int> mask_to_prefix(const std::string& mask);
std::optional<int> mask_to_prefix(uint32_t mask);
// "network/prefix" for any address inside the block.
std::string network_cidr(uint32_t addr, int prefix);

// A CIDR block fixed for the duration of one scan. Host enumeration is lazy
// so large blocks do not materialize their address list.
class ScanRange {
public:
    ScanRange(uint32_t network, int prefix);
    // Accepts "a.b.c.d/n" or a bare address (/32). Host bits are masked off.
    // Throws ScanConfigurationError on anything else.
    static ScanRange parse(const std::string& text);

    uint32_t network() const { return network_; }
    int prefix() const { return prefix_; }
    uint32_t netmask() const { return prefix_to_mask(prefix_); }
    uint32_t broadcast() const { return network_ | ~netmask(); }
    std::string to_string() const { return format_ipv4(network_) + "/" + std::to_string(prefix_); }

    // Usable hosts: network and broadcast excluded for /0../30; a /31 yields
    // both addresses and a /32 its single address.
    uint64_t host_count() const;
    uint32_t host_at(uint64_t index) const;
    bool contains(uint32_t addr) const { return (addr & netmask()) == network_; }
private:
    uint32_t network_;
    int prefix_;
};

}
