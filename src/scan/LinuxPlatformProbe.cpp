#include "LinuxPlatformProbe.h"
#include "MacAddress.h"
#include "../core/Utils.h"
#include "../core/Logging.h"
#include <atomic>
#include <chrono>
#include <cstring>
#include <cctype>
#include <cerrno>
#include <sstream>
#include <regex>
#include <unistd.h>
#include <poll.h>
#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <netinet/ip_icmp.h>
#include <sys/socket.h>

namespace lan_scan {

namespace {

// closes the descriptor on every return path
struct FdGuard {
    int fd;
    explicit FdGuard(int f): fd(f) {}
    ~FdGuard(){ if(fd >= 0) close(fd); }
    FdGuard(const FdGuard&) = delete;
    FdGuard& operator=(const FdGuard&) = delete;
};

std::atomic<uint16_t> echo_sequence{1};

// ip appears as a whole token (10.0.0.5 must not match 10.0.0.50)
bool line_mentions_ip(const std::string& line, const std::string& ip){
    size_t pos = 0;
    while((pos = line.find(ip, pos)) != std::string::npos){
        bool left_ok = pos == 0 || !(std::isdigit(static_cast<unsigned char>(line[pos-1])) || line[pos-1] == '.');
        size_t end = pos + ip.size();
        bool right_ok = end >= line.size() || !(std::isdigit(static_cast<unsigned char>(line[end])) || line[end] == '.');
        if(left_ok && right_ok) return true;
        pos = end;
    }
    return false;
}

}

PlatformProbePtr make_platform_probe(){
    return std::make_shared<LinuxPlatformProbe>();
}

bool ping_output_indicates_alive(const std::string& output, int exit_status){
    static const std::regex ttl_re(R"(ttl[=:]\s*\d+)", std::regex::icase);
    if(std::regex_search(output, ttl_re)) return true;
    return exit_status == 0;
}

std::optional<std::string> parse_proc_net_arp(const std::string& content, const std::string& ip){
    std::istringstream in(content);
    std::string line;
    std::getline(in, line); // header
    while(std::getline(in, line)){
        std::istringstream row(line);
        std::string addr, hw_type, flags, hw_addr;
        if(!(row >> addr >> hw_type >> flags >> hw_addr)) continue;
        if(addr != ip) continue;
        // flags 0x0 marks an incomplete entry
        if(flags == "0x0") return std::nullopt;
        return normalize_mac(hw_addr);
    }
    return std::nullopt;
}

std::optional<std::string> extract_mac_for_ip(const std::string& output, const std::string& ip){
    std::istringstream in(output);
    std::string line;
    while(std::getline(in, line)){
        if(!line_mentions_ip(line, ip)) continue;
        if(auto mac = find_first_mac(line)) return mac;
    }
    return std::nullopt;
}

std::optional<bool> LinuxPlatformProbe::icmp_echo(const std::string& ip, int timeout_seconds){
    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    if(inet_pton(AF_INET, ip.c_str(), &addr.sin_addr) != 1) return false;

    FdGuard sock(socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, IPPROTO_ICMP));
    if(sock.fd < 0) return std::nullopt; // ping_group_range excludes us
    if(connect(sock.fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) return false;

    uint16_t seq = echo_sequence.fetch_add(1);
    unsigned char packet[sizeof(icmphdr) + 16]{};
    icmphdr hdr{};
    hdr.type = ICMP_ECHO;
    hdr.code = 0;
    hdr.un.echo.sequence = htons(seq); // id and checksum are filled in by the kernel
    std::memcpy(packet, &hdr, sizeof(hdr));
    std::memcpy(packet + sizeof(hdr), "lan-scan-probe..", 16);
    if(send(sock.fd, packet, sizeof(packet), 0) < 0) return false;

    auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(timeout_seconds);
    unsigned char buf[512];
    while(true){
        auto left = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - std::chrono::steady_clock::now()).count();
        if(left <= 0) return false;
        pollfd pfd{sock.fd, POLLIN, 0};
        int rc = poll(&pfd, 1, static_cast<int>(left));
        if(rc < 0){ if(errno == EINTR) continue; return false; }
        if(rc == 0) return false;
        ssize_t n = recv(sock.fd, buf, sizeof(buf), 0);
        if(n < 0){
            if(errno == EINTR || errno == EAGAIN) continue;
            return false; // e.g. ICMP unreachable reported as ECONNREFUSED/EHOSTUNREACH
        }
        if(static_cast<size_t>(n) < sizeof(icmphdr)) continue;
        icmphdr reply{};
        std::memcpy(&reply, buf, sizeof(reply));
        if(reply.type == ICMP_ECHOREPLY && ntohs(reply.un.echo.sequence) == seq) return true;
    }
}

bool LinuxPlatformProbe::ping_utility(const std::string& ip, int timeout_seconds){
    auto res = utils::run_command({"ping", "-c", "1", "-W", std::to_string(timeout_seconds), ip});
    if(!res.launched || res.exit_status == 127) return false;
    return ping_output_indicates_alive(res.output, res.exit_status);
}

bool LinuxPlatformProbe::is_reachable(const std::string& ip, int timeout_seconds){
    if(auto native = icmp_echo(ip, timeout_seconds)) return *native;
    static std::atomic<bool> logged{false};
    if(!logged.exchange(true)) Logger::instance().debug("ICMP datagram sockets unavailable; using ping utility");
    return ping_utility(ip, timeout_seconds);
}

std::optional<std::string> LinuxPlatformProbe::resolve_hostname(const std::string& ip){
    sockaddr_in sa{};
    sa.sin_family = AF_INET;
    if(inet_pton(AF_INET, ip.c_str(), &sa.sin_addr) != 1) return std::nullopt;
    char host[NI_MAXHOST];
    if(getnameinfo(reinterpret_cast<sockaddr*>(&sa), sizeof(sa), host, sizeof(host), nullptr, 0, NI_NAMEREQD) != 0) return std::nullopt;
    std::string name = host;
    if(name.empty()) return std::nullopt;
    return name;
}

std::optional<std::string> LinuxPlatformProbe::lookup_mac(const std::string& ip){
    if(auto content = utils::read_file("/proc/net/arp")){
        if(auto mac = parse_proc_net_arp(*content, ip)) return mac;
    }
    auto neigh = utils::run_command({"ip", "neigh", "show", ip});
    if(neigh.launched && neigh.exit_status == 0){
        if(auto mac = extract_mac_for_ip(neigh.output, ip)) return mac;
    }
    auto arp = utils::run_command({"arp", "-n", ip});
    if(arp.launched && arp.exit_status != 127){
        if(auto mac = extract_mac_for_ip(arp.output, ip)) return mac;
    }
    return std::nullopt;
}

}
