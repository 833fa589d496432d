#include <gtest/gtest.h>
#include "cw/Ipv4Range.hpp"

#include <stdexcept>

using namespace cw;

TEST(Ipv4RangeTest, CidrSkipsNetworkAndBroadcast) {
    auto r = Ipv4Range::parse("192.168.1.0/24");
    EXPECT_EQ(r.size(), 254u);
    auto hosts = r.hosts();
    EXPECT_EQ(hosts.front(), "192.168.1.1");
    EXPECT_EQ(hosts.back(), "192.168.1.254");
}

TEST(Ipv4RangeTest, CidrHostBitsAreMasked) {
    auto r = Ipv4Range::parse("10.0.0.77/30");
    EXPECT_EQ(r.toString(), "10.0.0.77-10.0.0.78");
    EXPECT_EQ(Ipv4Range::parse("10.0.0.9/32").toString(), "10.0.0.9");
    EXPECT_EQ(Ipv4Range::parse("10.0.0.8/31").size(), 2u);
}

TEST(Ipv4RangeTest, DashRanges) {
    EXPECT_EQ(Ipv4Range::parse("192.168.1.10-192.168.1.20").size(), 11u);
    auto shortForm = Ipv4Range::parse("192.168.1.10-12");
    auto hosts = shortForm.hosts();
    ASSERT_EQ(hosts.size(), 3u);
    EXPECT_EQ(hosts[2], "192.168.1.12");
    EXPECT_EQ(Ipv4Range::parse(" 10.0.0.1 - 10.0.1.1 ").size(), 257u);
}

TEST(Ipv4RangeTest, SingleAddress) {
    auto r = Ipv4Range::parse("172.16.0.4");
    EXPECT_EQ(r.size(), 1u);
    EXPECT_EQ(r.hosts().front(), "172.16.0.4");
}

TEST(Ipv4RangeTest, SixteenBitPrefixIsTheWidest) {
    EXPECT_EQ(Ipv4Range::parse("10.1.0.0/16").size(), 65534u);
    EXPECT_THROW(Ipv4Range::parse("10.0.0.0/15"), std::invalid_argument);
    EXPECT_THROW(Ipv4Range::parse("10.0.0.0-10.2.0.0"), std::invalid_argument);
}

TEST(Ipv4RangeTest, MalformedInputThrows) {
    EXPECT_THROW(Ipv4Range::parse(""), std::invalid_argument);
    EXPECT_THROW(Ipv4Range::parse("not-an-ip"), std::invalid_argument);
    EXPECT_THROW(Ipv4Range::parse("192.168.1.0/abc"), std::invalid_argument);
    EXPECT_THROW(Ipv4Range::parse("192.168.1.0/33"), std::invalid_argument);
    EXPECT_THROW(Ipv4Range::parse("192.168.1.300"), std::invalid_argument);
    EXPECT_THROW(Ipv4Range::parse("192.168.1.20-10"), std::invalid_argument);
    EXPECT_THROW(Ipv4Range::parse("192.168.1.1-999"), std::invalid_argument);
}

TEST(Ipv4RangeTest, FormatAndParseAddresses) {
    std::uint32_t addr = 0;
    ASSERT_TRUE(parseIpv4("1.2.3.4", addr));
    EXPECT_EQ(addr, 0x01020304u);
    EXPECT_EQ(formatIpv4(0xC0A80001u), "192.168.0.1");
    EXPECT_FALSE(parseIpv4("1.2.3", addr));
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
