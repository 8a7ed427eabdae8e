#pragma once
#include "PlatformProbe.h"
#include <string>
#include <optional>

namespace lan_scan {

class LinuxPlatformProbe : public PlatformProbe {
public:
    std::string name() const override { return "linux"; }
    bool is_reachable(const std::string& ip, int timeout_seconds) override;
    std::optional<std::string> resolve_hostname(const std::string& ip) override;
    std::optional<std::string> lookup_mac(const std::string& ip) override;

    // Echo over an unprivileged ICMP datagram socket; nullopt when the
    // kernel does not allow such sockets for this user.
    static std::optional<bool> icmp_echo(const std::string& ip, int timeout_seconds);
    // Falls back to the system ping utility.
    static bool ping_utility(const std::string& ip, int timeout_seconds);
};

// A reply carries a TTL field ("ttl=64", "TTL=128") or ping exited 0.
bool ping_output_indicates_alive(const std::string& output, int exit_status);

// MAC column of the /proc/net/arp row for ip; nullopt if absent or incomplete.
std::optional<std::string> parse_proc_net_arp(const std::string& content, const std::string& ip);

// First MAC on a line mentioning ip, as printed by `arp -n`, `arp -a` or
// `ip neigh show`.
std::optional<std::string> extract_mac_for_ip(const std::string& output, const std::string& ip);

}
