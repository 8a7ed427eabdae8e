#pragma once
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>

namespace lan_scan {

struct NetworkInfo {
    std::string local_ip;
    std::string cidr; // network/prefix
    std::string source; // strategy that produced it
};

// One way of finding the local address and subnet.
class RangeStrategy {
public:
    virtual ~RangeStrategy() = default;
    virtual std::string name() const = 0;
    virtual std::optional<NetworkInfo> detect() = 0;
};

using RangeStrategyPtr = std::unique_ptr<RangeStrategy>;

// Tries registered strategies in order; first success wins.
class NetworkRangeDetector {
public:
    void register_strategy(RangeStrategyPtr strategy);
    // Interface enumeration, `ip -4 addr`, ifconfig, outbound UDP socket,
    // then the 0.0.0.0/24 placeholder.
    void register_all_default();
    // Throws DetectionError once every strategy has failed.
    NetworkInfo detect() const;
    size_t strategy_count() const { return strategies_.size(); }
private:
    std::vector<RangeStrategyPtr> strategies_;
};

// Builds the CIDR for an address and prefix; nullopt for bad input.
std::optional<NetworkInfo> network_info_from(const std::string& ip, int prefix, const std::string& source);

// `ip -4 addr` output: first non-loopback "inet a.b.c.d/n".
std::optional<NetworkInfo> parse_ip_addr_output(const std::string& output);

// ifconfig / ipconfig style output. Address and mask labels are matched
// loosely so localized tools (Maske:, Maska podsítě, netmask 0xffffff00)
// parse; an unlabelled 255.x.x.x mask following an address is accepted too.
std::optional<NetworkInfo> parse_ifconfig_output(const std::string& output);

// Interface carrying the default route in /proc/net/route content.
std::optional<std::string> parse_default_route_interface(const std::string& content);

class InterfaceEnumerationStrategy : public RangeStrategy {
public:
    std::string name() const override { return "interfaces"; }
    std::optional<NetworkInfo> detect() override;
};

// Runs a configuration tool and parses its text output.
class CommandOutputStrategy : public RangeStrategy {
public:
    using Parser = std::function<std::optional<NetworkInfo>(const std::string&)>;
    CommandOutputStrategy(std::string name, std::vector<std::string> argv, Parser parser)
        : name_(std::move(name)), argv_(std::move(argv)), parser_(std::move(parser)) {}
    std::string name() const override { return name_; }
    std::optional<NetworkInfo> detect() override;
private:
    std::string name_;
    std::vector<std::string> argv_;
    Parser parser_;
};

// Connects a UDP socket toward a public address (nothing is sent) so the
// kernel picks the source address; assumes /24.
class OutboundSocketStrategy : public RangeStrategy {
public:
    explicit OutboundSocketStrategy(std::string target = "8.8.8.8") : target_(std::move(target)) {}
    std::string name() const override { return "outbound-socket"; }
    std::optional<NetworkInfo> detect() override;
private:
    std::string target_;
};

// Degenerate 0.0.0.0/24 result; a scan of it simply finds nothing.
class PlaceholderStrategy : public RangeStrategy {
public:
    std::string name() const override { return "placeholder"; }
    std::optional<NetworkInfo> detect() override;
};

}
