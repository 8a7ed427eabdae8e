#include "scan/NetworkRangeDetector.h"
#include "core/Errors.h"
#include "core/Logging.h"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <stdexcept>

using ::testing::Return;
using ::testing::Throw;

namespace lan_scan {

class MockRangeStrategy : public RangeStrategy {
public:
    MOCK_METHOD(std::string, name, (), (const, override));
    MOCK_METHOD(std::optional<NetworkInfo>, detect, (), (override));
};

class NetworkRangeDetectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        Logger::instance().set_level(LogLevel::Error);
    }
    void TearDown() override {
        Logger::instance().set_level(LogLevel::Info);
    }

    std::unique_ptr<MockRangeStrategy> make_strategy(const std::string& name, std::optional<NetworkInfo> result) {
        auto s = std::make_unique<MockRangeStrategy>();
        ON_CALL(*s, name()).WillByDefault(Return(name));
        EXPECT_CALL(*s, name()).Times(::testing::AnyNumber());
        if (result) EXPECT_CALL(*s, detect()).WillOnce(Return(result));
        else EXPECT_CALL(*s, detect()).WillOnce(Return(std::nullopt));
        return s;
    }
};

TEST_F(NetworkRangeDetectorTest, NetworkInfoFromAddress) {
    auto info = network_info_from("192.168.1.57", 24, "test");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->local_ip, "192.168.1.57");
    EXPECT_EQ(info->cidr, "192.168.1.0/24");
    EXPECT_EQ(info->source, "test");
    EXPECT_FALSE(network_info_from("192.168.1", 24, "test").has_value());
    EXPECT_FALSE(network_info_from("192.168.1.57", 33, "test").has_value());
}

TEST_F(NetworkRangeDetectorTest, ParseIpAddrOutputSkipsLoopback) {
    const std::string out =
        "1: lo: <LOOPBACK,UP,LOWER_UP> mtu 65536 qdisc noqueue state UNKNOWN group default qlen 1000\n"
        "    inet 127.0.0.1/8 scope host lo\n"
        "       valid_lft forever preferred_lft forever\n"
        "2: eth0: <BROADCAST,MULTICAST,UP,LOWER_UP> mtu 1500 qdisc fq_codel state UP group default qlen 1000\n"
        "    inet 192.168.1.23/24 brd 192.168.1.255 scope global dynamic eth0\n";
    auto info = parse_ip_addr_output(out);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->local_ip, "192.168.1.23");
    EXPECT_EQ(info->cidr, "192.168.1.0/24");
}

TEST_F(NetworkRangeDetectorTest, ParseIpAddrOutputPrefersNonLinkLocal) {
    const std::string out =
        "    inet 169.254.10.2/16 scope link eth1\n"
        "    inet 10.20.30.40/20 scope global eth0\n";
    auto info = parse_ip_addr_output(out);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->cidr, "10.20.16.0/20");
}

TEST_F(NetworkRangeDetectorTest, ParseIpAddrOutputOnlyLoopback) {
    EXPECT_FALSE(parse_ip_addr_output("    inet 127.0.0.1/8 scope host lo\n").has_value());
    EXPECT_FALSE(parse_ip_addr_output("").has_value());
}

TEST_F(NetworkRangeDetectorTest, ParseLinuxIfconfig) {
    const std::string out =
        "eth0: flags=4163<UP,BROADCAST,RUNNING,MULTICAST>  mtu 1500\n"
        "        inet 192.168.1.23  netmask 255.255.255.0  broadcast 192.168.1.255\n"
        "        inet6 fe80::1  prefixlen 64  scopeid 0x20<link>\n"
        "lo: flags=73<UP,LOOPBACK,RUNNING>  mtu 65536\n"
        "        inet 127.0.0.1  netmask 255.0.0.0\n";
    auto info = parse_ifconfig_output(out);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->local_ip, "192.168.1.23");
    EXPECT_EQ(info->cidr, "192.168.1.0/24");
    EXPECT_EQ(info->source, "ifconfig");
}

TEST_F(NetworkRangeDetectorTest, ParseLegacyIfconfig) {
    const std::string out =
        "eth0      Link encap:Ethernet  HWaddr 00:11:22:33:44:55\n"
        "          inet addr:10.0.5.9  Bcast:10.0.5.255  Mask:255.255.254.0\n";
    auto info = parse_ifconfig_output(out);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->cidr, "10.0.4.0/23");
}

TEST_F(NetworkRangeDetectorTest, ParseBsdHexNetmask) {
    const std::string out =
        "en0: flags=8863<UP,BROADCAST,SMART,RUNNING,SIMPLEX,MULTICAST> mtu 1500\n"
        "\tinet 172.16.4.20 netmask 0xffff0000 broadcast 172.16.255.255\n";
    auto info = parse_ifconfig_output(out);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->cidr, "172.16.0.0/16");
}

TEST_F(NetworkRangeDetectorTest, ParseIpconfigAcrossLines) {
    const std::string out =
        "Ethernet adapter Ethernet:\r\n"
        "   IPv4 Address. . . . . . . . . . . : 192.168.0.105\r\n"
        "   Subnet Mask . . . . . . . . . . . : 255.255.255.0\r\n"
        "   Default Gateway . . . . . . . . . : 192.168.0.1\r\n";
    auto info = parse_ifconfig_output(out);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->local_ip, "192.168.0.105");
    EXPECT_EQ(info->cidr, "192.168.0.0/24");
}

TEST_F(NetworkRangeDetectorTest, ParseLocalizedIpconfig) {
    const std::string german =
        "   IPv4-Adresse  . . . . . . . . . . : 192.168.178.20\n"
        "   Subnetzmaske  . . . . . . . . . . : 255.255.255.0\n";
    auto de = parse_ifconfig_output(german);
    ASSERT_TRUE(de.has_value());
    EXPECT_EQ(de->cidr, "192.168.178.0/24");

    const std::string spanish =
        "   Direcci\xC3\xB3n IPv4. . . . . . . . . . . : 10.1.1.7\n"
        "   M\xC3\xA1scara de subred . . . . . . . . : 255.255.0.0\n";
    auto es = parse_ifconfig_output(spanish);
    ASSERT_TRUE(es.has_value());
    EXPECT_EQ(es->cidr, "10.1.0.0/16");

    const std::string russian =
        "   IPv4-\xD0\xB0\xD0\xB4\xD1\x80\xD0\xB5\xD1\x81. . . . . . . . . . . : 192.168.10.4\n"
        "   \xD0\x9C\xD0\xB0\xD1\x81\xD0\xBA\xD0\xB0 \xD0\xBF\xD0\xBE\xD0\xB4\xD1\x81\xD0\xB5\xD1\x82\xD0\xB8 . . . . : 255.255.255.128\n";
    auto ru = parse_ifconfig_output(russian);
    ASSERT_TRUE(ru.has_value());
    EXPECT_EQ(ru->cidr, "192.168.10.0/25");
}

TEST_F(NetworkRangeDetectorTest, ParseUnlabelledMask) {
    const std::string out =
        "   IPv4 . . . : 10.9.8.7\n"
        "   ??? . . . . : 255.255.255.0\n";
    auto info = parse_ifconfig_output(out);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->cidr, "10.9.8.0/24");
}

TEST_F(NetworkRangeDetectorTest, ParseIfconfigWithoutMask) {
    EXPECT_FALSE(parse_ifconfig_output("inet 10.0.0.2\n").has_value());
    EXPECT_FALSE(parse_ifconfig_output("no addresses here\n").has_value());
}

TEST_F(NetworkRangeDetectorTest, DefaultRouteInterface) {
    const std::string route =
        "Iface\tDestination\tGateway \tFlags\tRefCnt\tUse\tMetric\tMask\t\tMTU\tWindow\tIRTT\n"
        "wlan0\t00000000\t0101A8C0\t0003\t0\t0\t600\t00000000\t0\t0\t0\n"
        "eth0\t00000000\t0100000A\t0003\t0\t0\t100\t00000000\t0\t0\t0\n"
        "eth0\t0000000A\t00000000\t0001\t0\t0\t100\t00FFFFFF\t0\t0\t0\n";
    EXPECT_EQ(parse_default_route_interface(route), "eth0");
    EXPECT_FALSE(parse_default_route_interface("Iface\tDestination\n").has_value());
}

TEST_F(NetworkRangeDetectorTest, FirstSuccessfulStrategyWins) {
    NetworkRangeDetector detector;
    detector.register_strategy(make_strategy("first", std::nullopt));
    detector.register_strategy(make_strategy("second", NetworkInfo{"10.0.0.9", "10.0.0.0/24", "second"}));
    auto third = std::make_unique<MockRangeStrategy>();
    EXPECT_CALL(*third, detect()).Times(0);
    detector.register_strategy(std::move(third));

    auto info = detector.detect();
    EXPECT_EQ(info.local_ip, "10.0.0.9");
    EXPECT_EQ(info.source, "second");
    EXPECT_EQ(detector.strategy_count(), 3u);
}

TEST_F(NetworkRangeDetectorTest, ThrowingStrategyIsSkipped) {
    NetworkRangeDetector detector;
    auto failing = std::make_unique<MockRangeStrategy>();
    EXPECT_CALL(*failing, name()).WillRepeatedly(Return("failing"));
    EXPECT_CALL(*failing, detect()).WillOnce(Throw(std::runtime_error("socket exploded")));
    detector.register_strategy(std::move(failing));
    detector.register_strategy(make_strategy("ok", NetworkInfo{"192.168.5.5", "192.168.5.0/24", "ok"}));

    EXPECT_EQ(detector.detect().cidr, "192.168.5.0/24");
}

TEST_F(NetworkRangeDetectorTest, ExhaustedStrategiesThrowDetectionError) {
    NetworkRangeDetector detector;
    detector.register_strategy(make_strategy("a", std::nullopt));
    detector.register_strategy(make_strategy("b", std::nullopt));
    EXPECT_THROW(detector.detect(), DetectionError);
}

TEST_F(NetworkRangeDetectorTest, NoStrategiesThrowDetectionError) {
    NetworkRangeDetector detector;
    EXPECT_THROW(detector.detect(), DetectionError);
}

TEST_F(NetworkRangeDetectorTest, PlaceholderNeverFails) {
    PlaceholderStrategy placeholder;
    auto info = placeholder.detect();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->local_ip, "0.0.0.0");
    EXPECT_EQ(info->cidr, "0.0.0.0/24");
}

TEST_F(NetworkRangeDetectorTest, DefaultStrategiesAlwaysYieldValidRange) {
    NetworkRangeDetector detector;
    detector.register_all_default();
    EXPECT_EQ(detector.strategy_count(), 5u);
    NetworkInfo info;
    ASSERT_NO_THROW(info = detector.detect());
    EXPECT_FALSE(info.local_ip.empty());
    EXPECT_THAT(info.cidr, ::testing::MatchesRegex("[0-9.]+/[0-9]+"));
}

TEST_F(NetworkRangeDetectorTest, CommandStrategyMissingTool) {
    CommandOutputStrategy strategy("missing", {"lan-scan-no-such-tool-xyz"}, parse_ifconfig_output);
    EXPECT_FALSE(strategy.detect().has_value());
}

TEST_F(NetworkRangeDetectorTest, CommandStrategyTagsSource) {
    CommandOutputStrategy strategy("echo-tool", {"echo", "inet 10.4.4.4/24 scope global eth0"}, parse_ip_addr_output);
    auto info = strategy.detect();
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->cidr, "10.4.4.0/24");
    EXPECT_EQ(info->source, "echo-tool");
}

} // namespace lan_scan
