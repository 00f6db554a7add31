#include "AddressClassifier.hpp"
#include "Errors.hpp"
#include <gtest/gtest.h>

TEST(AddressClassifierTest, Literals) {
    EXPECT_EQ(classify("192.168.1.1"), AddressKind::Ipv4Literal);
    EXPECT_EQ(classify(" 10.0.0.1 "), AddressKind::Ipv4Literal);
    EXPECT_EQ(classify("::1"), AddressKind::Ipv6Literal);
    EXPECT_EQ(classify("2001:db8::1"), AddressKind::Ipv6Literal);
    EXPECT_EQ(classify("::ffff:10.0.0.1"), AddressKind::Ipv6Literal);
}

TEST(AddressClassifierTest, Subnets) {
    EXPECT_EQ(classify("192.168.5.0/30"), AddressKind::Ipv4Subnet);
    EXPECT_EQ(classify("10.0.0.1/32"), AddressKind::Ipv4Subnet);
    EXPECT_EQ(classify("2001:db8::/126"), AddressKind::Ipv6Subnet);
    EXPECT_THROW(classify("10.0.0.1/33"), AddressClassificationError);
    EXPECT_THROW(classify("2001:db8::/129"), AddressClassificationError);
    EXPECT_THROW(classify("10.0.0.0/"), AddressClassificationError);
}

TEST(AddressClassifierTest, Ranges) {
    EXPECT_EQ(classify("192.168.5.5-192.168.5.8"), AddressKind::Ipv4Range);
    EXPECT_EQ(classify("192.168.5.5 - 192.168.5.8"), AddressKind::Ipv4Range);
    EXPECT_EQ(classify("2001:db8::1-2001:db8::3"), AddressKind::Ipv6Range);
    // order is checked by the expander, not here
    EXPECT_EQ(classify("10.0.0.9-10.0.0.1"), AddressKind::Ipv4Range);
    EXPECT_THROW(classify("10.0.0.1-::1"), AddressClassificationError);
    EXPECT_THROW(classify("10.0.0.1-"), AddressClassificationError);
}

TEST(AddressClassifierTest, Domains) {
    EXPECT_EQ(classify("example.com"), AddressKind::Domain);
    EXPECT_EQ(classify("example.COM"), AddressKind::Domain);
    EXPECT_EQ(classify("www.vut.cz"), AddressKind::Domain);
    EXPECT_EQ(classify("my-host.example.org"), AddressKind::Domain);
    EXPECT_EQ(classify("example.com."), AddressKind::Domain);
}

TEST(AddressClassifierTest, Rejected) {
    EXPECT_THROW(classify("foo.notatld"), AddressClassificationError);
    EXPECT_THROW(classify("localhost"), AddressClassificationError);
    EXPECT_THROW(classify("999.1.1.1"), AddressClassificationError);
    EXPECT_THROW(classify("1.2.3"), AddressClassificationError);
    EXPECT_THROW(classify(""), AddressClassificationError);
}

TEST(AddressClassifierTest, SplitHelpers) {
    std::string address, start, end;
    int prefix = -1;
    ASSERT_TRUE(split_subnet("10.1.0.0/16", false, address, prefix));
    EXPECT_EQ(address, "10.1.0.0");
    EXPECT_EQ(prefix, 16);
    EXPECT_FALSE(split_subnet("10.1.0.0/16", true, address, prefix));

    ASSERT_TRUE(split_range("a - b-c", start, end));
    EXPECT_EQ(start, "a");
    EXPECT_EQ(end, "b-c");
}
