#include "core/ScanRange.h"
#include "core/Errors.h"
#include "scan/NetworkRangeDetector.h"
#include "scan/LinuxPlatformProbe.h"
#include "scan/MacAddress.h"
#include <cstdint>
#include <cstdlib>
#include <string>

// Range parsing plus the text parsers fed by external tool output.
extern "C" int LLVMFuzzerTestOneInput(const uint8_t *data, size_t size) {
    std::string input(reinterpret_cast<const char*>(data), size);

    try {
        auto range = lan_scan::ScanRange::parse(input);
        uint64_t count = range.host_count();
        if (count > 0) {
            uint32_t first = range.host_at(0);
            uint32_t last = range.host_at(count - 1);
            if (!range.contains(first) || !range.contains(last)) std::abort();
        }
    } catch (const lan_scan::ScanConfigurationError&) {
    }

    (void)lan_scan::parse_ifconfig_output(input);
    (void)lan_scan::parse_ip_addr_output(input);
    (void)lan_scan::parse_default_route_interface(input);
    (void)lan_scan::parse_proc_net_arp(input, "192.168.1.1");
    (void)lan_scan::extract_mac_for_ip(input, "192.168.1.1");
    if (auto mac = lan_scan::normalize_mac(input)) {
        if (mac->size() != 17) std::abort();
    }
    return 0;
}
