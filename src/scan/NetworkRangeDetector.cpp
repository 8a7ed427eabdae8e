#include "NetworkRangeDetector.h"
#include "../core/ScanRange.h"
#include "../core/Errors.h"
#include "../core/Logging.h"
#include "../core/Utils.h"
#include <regex>
#include <sstream>
#include <climits>
#include <cstdlib>
#include <unistd.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <arpa/inet.h>
#include <sys/socket.h>

namespace lan_scan {

namespace {

bool is_loopback(uint32_t addr){ return (addr >> 24) == 127; }
bool is_link_local(uint32_t addr){ return (addr >> 16) == 0xA9FE; }

struct Candidate { uint32_t addr; int prefix; };

// First candidate that is neither loopback nor link-local, else the first
// non-loopback one.
std::optional<Candidate> pick_primary(const std::vector<Candidate>& candidates){
    const Candidate* fallback = nullptr;
    for(const auto& c : candidates){
        if(is_loopback(c.addr)) continue;
        if(!is_link_local(c.addr)) return c;
        if(!fallback) fallback = &c;
    }
    if(fallback) return *fallback;
    return std::nullopt;
}

std::optional<uint32_t> parse_mask_token(const std::string& token){
    if(token.size() == 10 && (token.rfind("0x", 0) == 0 || token.rfind("0X", 0) == 0)){
        char* end = nullptr;
        unsigned long v = std::strtoul(token.c_str() + 2, &end, 16);
        if(end && *end == '\0') return static_cast<uint32_t>(v);
        return std::nullopt;
    }
    return parse_ipv4(token);
}

}

std::optional<NetworkInfo> network_info_from(const std::string& ip, int prefix, const std::string& source){
    auto addr = parse_ipv4(ip);
    if(!addr || prefix < 0 || prefix > 32) return std::nullopt;
    return NetworkInfo{ip, network_cidr(*addr, prefix), source};
}

std::optional<NetworkInfo> parse_ip_addr_output(const std::string& output){
    static const std::regex inet_re(R"(\binet\s+(\d{1,3}(?:\.\d{1,3}){3})/(\d{1,2}))");
    std::vector<Candidate> candidates;
    std::istringstream in(output);
    std::string line;
    while(std::getline(in, line)){
        std::smatch m;
        if(!std::regex_search(line, m, inet_re)) continue;
        auto addr = parse_ipv4(m[1].str());
        int prefix = std::stoi(m[2].str());
        if(!addr || prefix > 32) continue;
        candidates.push_back({*addr, prefix});
    }
    auto best = pick_primary(candidates);
    if(!best) return std::nullopt;
    return network_info_from(format_ipv4(best->addr), best->prefix, "ip-addr");
}

std::optional<NetworkInfo> parse_ifconfig_output(const std::string& output){
    static const std::regex addr_re(R"((?:inet|ipv4)[^\d\n]*?(\d{1,3}(?:\.\d{1,3}){3}))", std::regex::icase);
    static const std::regex mask_re(
        "(?:netmask|mask|maske|masque|m(?:a|\xC3\xA1)scara|maschera|maska|\xD0\x9C\xD0\xB0\xD1\x81\xD0\xBA\xD0\xB0|\xD0\xBC\xD0\xB0\xD1\x81\xD0\xBA\xD0\xB0)"
        R"([^\d\n]*?(0x[0-9a-f]{8}|\d{1,3}(?:\.\d{1,3}){3}))", std::regex::icase);
    static const std::regex bare_mask_re(R"((?:^|[^\d.])(255\.\d{1,3}\.\d{1,3}\.\d{1,3})(?![\d.]))");

    std::vector<Candidate> candidates;
    std::optional<uint32_t> pending; // address still waiting for its mask
    std::istringstream in(output);
    std::string line;
    while(std::getline(in, line)){
        std::smatch m;
        std::string rest = line;
        if(std::regex_search(line, m, addr_re)){
            pending = parse_ipv4(m[1].str());
            rest = m.suffix().str();
        }
        if(!pending) continue;
        std::optional<uint32_t> mask;
        std::smatch mm;
        if(std::regex_search(rest, mm, mask_re)) mask = parse_mask_token(mm[1].str());
        else if(std::regex_search(rest, mm, bare_mask_re)) mask = parse_ipv4(mm[1].str());
        if(!mask) continue;
        auto prefix = mask_to_prefix(*mask);
        if(!prefix) continue;
        candidates.push_back({*pending, *prefix});
        pending.reset();
    }
    auto best = pick_primary(candidates);
    if(!best) return std::nullopt;
    return network_info_from(format_ipv4(best->addr), best->prefix, "ifconfig");
}

std::optional<std::string> parse_default_route_interface(const std::string& content){
    std::istringstream in(content);
    std::string line;
    std::getline(in, line); // header
    std::optional<std::string> best;
    long best_metric = LONG_MAX;
    while(std::getline(in, line)){
        std::istringstream row(line);
        std::string iface, dest, gateway, flags, refcnt, use, metric, mask;
        if(!(row >> iface >> dest >> gateway >> flags >> refcnt >> use >> metric >> mask)) continue;
        if(dest != "00000000" || mask != "00000000") continue;
        long m = std::strtol(metric.c_str(), nullptr, 10);
        if(!best || m < best_metric){ best = iface; best_metric = m; }
    }
    return best;
}

std::optional<NetworkInfo> InterfaceEnumerationStrategy::detect(){
    ifaddrs* ifaddr = nullptr;
    if(getifaddrs(&ifaddr) == -1){
        Logger::instance().debug("getifaddrs failed");
        return std::nullopt;
    }
    std::optional<std::string> default_iface;
    if(auto route = utils::read_file("/proc/net/route")) default_iface = parse_default_route_interface(*route);

    std::vector<Candidate> candidates;
    std::optional<Candidate> on_default_route;
    for(ifaddrs* ifa = ifaddr; ifa != nullptr; ifa = ifa->ifa_next){
        if(!ifa->ifa_addr || !ifa->ifa_netmask) continue;
        if(ifa->ifa_addr->sa_family != AF_INET) continue;
        if(!(ifa->ifa_flags & IFF_UP) || (ifa->ifa_flags & IFF_LOOPBACK)) continue;
        uint32_t addr = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr);
        uint32_t mask = ntohl(reinterpret_cast<sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr);
        auto prefix = mask_to_prefix(mask);
        if(!prefix) continue;
        Candidate c{addr, *prefix};
        if(default_iface && *default_iface == ifa->ifa_name && !on_default_route) on_default_route = c;
        candidates.push_back(c);
    }
    freeifaddrs(ifaddr);

    std::optional<Candidate> best = on_default_route ? on_default_route : pick_primary(candidates);
    if(!best) return std::nullopt;
    return network_info_from(format_ipv4(best->addr), best->prefix, name());
}

std::optional<NetworkInfo> CommandOutputStrategy::detect(){
    auto res = utils::run_command(argv_);
    if(!res.launched || res.exit_status != 0){
        Logger::instance().debug(name_ + ": command unavailable or failed (status " + std::to_string(res.exit_status) + ")");
        return std::nullopt;
    }
    auto info = parser_(res.output);
    if(info) info->source = name_;
    return info;
}

std::optional<NetworkInfo> OutboundSocketStrategy::detect(){
    int fd = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if(fd < 0) return std::nullopt;
    sockaddr_in target{};
    target.sin_family = AF_INET;
    target.sin_port = htons(80);
    if(inet_pton(AF_INET, target_.c_str(), &target.sin_addr) != 1){ close(fd); return std::nullopt; }
    std::optional<NetworkInfo> info;
    if(connect(fd, reinterpret_cast<sockaddr*>(&target), sizeof(target)) == 0){
        sockaddr_in local{};
        socklen_t len = sizeof(local);
        if(getsockname(fd, reinterpret_cast<sockaddr*>(&local), &len) == 0){
            uint32_t addr = ntohl(local.sin_addr.s_addr);
            if(addr != 0) info = network_info_from(format_ipv4(addr), 24, name());
        }
    }
    close(fd);
    return info;
}

std::optional<NetworkInfo> PlaceholderStrategy::detect(){
    Logger::instance().warn("Network auto-detection failed; using 0.0.0.0/24");
    return NetworkInfo{"0.0.0.0", "0.0.0.0/24", name()};
}

void NetworkRangeDetector::register_strategy(RangeStrategyPtr strategy){
    strategies_.push_back(std::move(strategy));
}

void NetworkRangeDetector::register_all_default(){
    register_strategy(std::make_unique<InterfaceEnumerationStrategy>());
    register_strategy(std::make_unique<CommandOutputStrategy>("ip-addr", std::vector<std::string>{"ip", "-4", "addr"}, parse_ip_addr_output));
    register_strategy(std::make_unique<CommandOutputStrategy>("ifconfig", std::vector<std::string>{"ifconfig"}, parse_ifconfig_output));
    register_strategy(std::make_unique<OutboundSocketStrategy>());
    register_strategy(std::make_unique<PlaceholderStrategy>());
}

NetworkInfo NetworkRangeDetector::detect() const {
    for(const auto& s : strategies_){
        Logger::instance().debug("Trying range detection strategy: " + s->name());
        try {
            if(auto info = s->detect()){
                Logger::instance().debug("Detected " + info->local_ip + " (" + info->cidr + ") via " + s->name());
                return *info;
            }
        } catch(const std::exception& ex){
            Logger::instance().warn("Range detection strategy " + s->name() + " failed: " + ex.what());
        }
    }
    throw DetectionError("no strategy could determine the local network range");
}

}
