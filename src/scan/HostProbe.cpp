#include "HostProbe.h"
#include "MacAddress.h"
#include "../core/DeviceRecord.h"
#include "../core/Logging.h"
#include "../core/Utils.h"

namespace lan_scan {

bool HostProbe::reachable(const std::string& ip) const {
    int attempts = options_.attempts < 1 ? 1 : options_.attempts;
    for(int i = 0; i < attempts; ++i){
        try {
            if(platform_.is_reachable(ip, options_.timeout_seconds)) return true;
        } catch(const std::exception& ex){
            Logger::instance().debug("reachability check for " + ip + " failed: " + ex.what());
        }
    }
    return false;
}

std::string HostProbe::hostname_for(const std::string& ip) const {
    try {
        if(auto name = platform_.resolve_hostname(ip)){
            std::string trimmed = utils::trim(*name);
            if(!trimmed.empty()) return trimmed;
        }
    } catch(const std::exception& ex){
        Logger::instance().debug("hostname lookup for " + ip + " failed: " + ex.what());
    }
    return ip;
}

std::string HostProbe::mac_for(const std::string& ip) const {
    try {
        if(auto raw = platform_.lookup_mac(ip)){
            if(auto mac = normalize_mac(utils::trim(*raw))) return *mac;
            if(auto mac = find_first_mac(*raw)) return *mac;
        }
    } catch(const std::exception& ex){
        Logger::instance().debug("MAC lookup for " + ip + " failed: " + ex.what());
    }
    return UNKNOWN_MAC;
}

std::optional<ProbeResult> HostProbe::probe(const std::string& ip) const {
    if(!reachable(ip)) return std::nullopt;
    ProbeResult result;
    result.ip = ip;
    result.hostname = hostname_for(ip);
    result.mac = mac_for(ip);
    result.scan_time = time_of_day_now();
    return result;
}

}
