#include <gtest/gtest.h>

#include "cellguard/utils/net_utils.hpp"

namespace cellguard {
namespace utils {

using namespace testing;

/*******************************************************************************
 * Tests
 ******************************************************************************/

TEST(NetUtilsTest, ParseAndFormatIPv4)
{
    auto address = NetUtils::ParseIPv4("172.20.3.1");

    ASSERT_TRUE(address.has_value());
    EXPECT_EQ(*address, (172u << 24) | (20u << 16) | (3u << 8) | 1u);
    EXPECT_EQ(NetUtils::FormatIPv4(*address), "172.20.3.1");

    EXPECT_FALSE(NetUtils::ParseIPv4("172.20.3").has_value());
    EXPECT_FALSE(NetUtils::ParseIPv4("256.1.1.1").has_value());
    EXPECT_FALSE(NetUtils::ParseIPv4("").has_value());
}

TEST(NetUtilsTest, CidrParsing)
{
    auto network = NetUtils::ParseIPv4Cidr("10.1.2.3/8");

    ASSERT_TRUE(network.has_value());
    EXPECT_EQ(network->prefix_length, 8);
    EXPECT_EQ(NetUtils::FormatIPv4(network->NetworkAddress()), "10.0.0.0");

    EXPECT_FALSE(NetUtils::ParseIPv4Cidr("10.1.2.3/33").has_value());
    EXPECT_FALSE(NetUtils::ParseIPv4Cidr("10.1.2.3").has_value());

    EXPECT_TRUE(NetUtils::IsCIDR("0.0.0.0/0"));
    EXPECT_TRUE(NetUtils::IsCIDR("fd00::/8"));
    EXPECT_FALSE(NetUtils::IsCIDR("example.com/24"));
}

TEST(NetUtilsTest, IpAddressDetection)
{
    EXPECT_TRUE(NetUtils::IsIPAddress("192.168.0.1"));
    EXPECT_TRUE(NetUtils::IsIPAddress("::1"));
    EXPECT_FALSE(NetUtils::IsIPAddress("192.168.0.0/16"));
    EXPECT_FALSE(NetUtils::IsIPAddress("localhost"));
}

TEST(NetUtilsTest, PortParsing)
{
    EXPECT_EQ(NetUtils::ParsePort("8080"), 8080);
    EXPECT_EQ(NetUtils::ParsePort("53/udp"), 53);
    EXPECT_EQ(NetUtils::ParsePort("443/tcp"), 443);
    EXPECT_EQ(NetUtils::ParsePort("70000"), 70000);
    EXPECT_EQ(NetUtils::ParsePort("0"), 0);

    EXPECT_FALSE(NetUtils::ParsePort("http").has_value());
    EXPECT_FALSE(NetUtils::ParsePort("80/sctp").has_value());
    EXPECT_FALSE(NetUtils::ParsePort("").has_value());
    EXPECT_FALSE(NetUtils::ParsePort("80x").has_value());
}

} // namespace utils
} // namespace cellguard
