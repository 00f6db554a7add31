#include "IpAddress.hpp"
#include <gtest/gtest.h>

TEST(IpAddressTest, ParseAndFormat) {
    auto v4 = IpAddress::parse("192.168.1.10");
    ASSERT_TRUE(v4.has_value());
    EXPECT_TRUE(v4->is_v4());
    EXPECT_EQ(v4->to_string(), "192.168.1.10");
    EXPECT_TRUE(v4->value() == ((IpAddress::u128(192) << 24) | (168 << 16) | (1 << 8) | 10));

    auto v6 = IpAddress::parse("2001:DB8:0:0::1");
    ASSERT_TRUE(v6.has_value());
    EXPECT_TRUE(v6->is_v6());
    EXPECT_EQ(v6->to_string(), "2001:db8::1");
}

TEST(IpAddressTest, Invalid) {
    EXPECT_FALSE(IpAddress::parse_v4("256.1.1.1"));
    EXPECT_FALSE(IpAddress::parse_v4("1.2.3"));
    EXPECT_FALSE(IpAddress::parse_v4("::1"));
    EXPECT_FALSE(IpAddress::parse_v6("1.2.3.4"));
    EXPECT_FALSE(IpAddress::parse_v6("2001:db8::g"));
}

TEST(IpAddressTest, OrderIsNumericAndV4First) {
    IpAddress a = *IpAddress::parse("10.0.0.2");
    IpAddress b = *IpAddress::parse("10.0.0.10");
    IpAddress c = *IpAddress::parse("::1");
    IpAddress d = *IpAddress::parse("255.255.255.255");
    EXPECT_TRUE(a < b);
    EXPECT_FALSE(b < a);
    EXPECT_TRUE(d < c);
    EXPECT_FALSE(c < d);
}

TEST(IpAddressTest, CidrBounds) {
    IpAddress ip = *IpAddress::parse("192.168.5.77");
    EXPECT_EQ(ip.network(24).to_string(), "192.168.5.0");
    EXPECT_EQ(ip.last(24).to_string(), "192.168.5.255");
    EXPECT_EQ(ip.network(32), ip);
    EXPECT_EQ(ip.last(32), ip);
    EXPECT_EQ(ip.network(0).to_string(), "0.0.0.0");
    EXPECT_EQ(ip.last(0).to_string(), "255.255.255.255");

    IpAddress v6 = *IpAddress::parse("2001:db8::1234");
    EXPECT_EQ(v6.network(120).to_string(), "2001:db8::1200");
    EXPECT_EQ(v6.last(120).to_string(), "2001:db8::12ff");
}

TEST(IpAddressTest, FromValue) {
    EXPECT_EQ(IpAddress::from_v4(0x0a000001).to_string(), "10.0.0.1");
    EXPECT_EQ(IpAddress::from_value(IpFamily::V6, 1).to_string(), "::1");
}
