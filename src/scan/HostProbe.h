#pragma once
#include "PlatformProbe.h"
#include <string>
#include <optional>

namespace lan_scan {

struct ProbeOptions {
    int timeout_seconds = 1;
    int attempts = 1; // echo attempts before a host is considered down
};

struct ProbeResult {
    std::string ip;
    std::string hostname; // never empty; the IP when unresolved
    std::string mac; // canonical form or UNKNOWN_MAC
    std::string scan_time; // HH:MM:SS
};

// Reachability, hostname and MAC for one address. Never throws: a down host
// yields nullopt and lookup failures degrade to fallback field values.
class HostProbe {
public:
    HostProbe(PlatformProbe& platform, ProbeOptions options) : platform_(platform), options_(options) {}
    std::optional<ProbeResult> probe(const std::string& ip) const;
    const ProbeOptions& options() const { return options_; }
private:
    bool reachable(const std::string& ip) const;
    std::string hostname_for(const std::string& ip) const;
    std::string mac_for(const std::string& ip) const;

    PlatformProbe& platform_;
    ProbeOptions options_;
};

}
