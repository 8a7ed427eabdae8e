#pragma once
#include <string>
#include <optional>
#include <memory>

namespace lan_scan {

// OS-level primitives a host probe is built from. Implementations must be
// safe to call concurrently from many worker threads.
class PlatformProbe {
public:
    virtual ~PlatformProbe() = default;
    virtual std::string name() const = 0;
    // Single echo request; true if the host answered within timeout_seconds.
    virtual bool is_reachable(const std::string& ip, int timeout_seconds) = 0;
    virtual std::optional<std::string> resolve_hostname(const std::string& ip) = 0;
    // Neighbor table entry for ip, in any separator style.
    virtual std::optional<std::string> lookup_mac(const std::string& ip) = 0;
};

using PlatformProbePtr = std::shared_ptr<PlatformProbe>;

// Probe implementation for the platform this binary was built for.
PlatformProbePtr make_platform_probe();

}
