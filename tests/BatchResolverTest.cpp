#include "BatchResolver.hpp"
#include "Errors.hpp"
#include "FakeResolver.hpp"
#include "Log.hpp"
#include <cstdio>
#include <fstream>
#include <gtest/gtest.h>

class BatchResolverTest : public ::testing::Test {
protected:
    FakeResolver resolver;
    TargetExpander expander{resolver, AddressFamilyPreference::IPv4First};
    BatchResolver batch{expander};
    std::vector<std::string> files;

    void SetUp() override {
        resolver.answers["example.com"] = {"93.184.216.34"};
        resolver.answers["empty.net"] = {"2001:db8::9"};
    }

    void TearDown() override {
        for (const auto &path : files)
            std::remove(path.c_str());
    }

    std::string write_file(const std::string &name, const std::string &content) {
        std::string path = ::testing::TempDir() + name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        files.push_back(path);
        return path;
    }

    static std::vector<std::string> addresses(const std::vector<Target> &targets) {
        std::vector<std::string> out;
        for (const auto &t : targets)
            out.push_back(t.address.to_string());
        return out;
    }
};

TEST_F(BatchResolverTest, ListIsConcatenationOfExpansions) {
    PortSet ports = parse_ports("80,443");
    auto a = expander.expand("10.0.0.1", ports);
    auto b = expander.expand("10.0.1.0/31", ports);
    auto c = expander.expand("example.com", ports);

    auto targets = batch.resolve_list("10.0.0.1, 10.0.1.0/31,,example.com", "80,443");
    ASSERT_EQ(targets.size(), a.size() + b.size() + c.size());
    std::vector<std::string> expected = {"10.0.0.1", "10.0.1.0", "10.0.1.1", "93.184.216.34"};
    EXPECT_EQ(addresses(targets), expected);
    EXPECT_FALSE(targets[0].origin.has_value());
    EXPECT_EQ(targets[1].origin.value_or(""), "10.0.1.0/31");
    EXPECT_EQ(targets[3].origin.value_or(""), "example.com");
    EXPECT_EQ(targets[3].ports, ports);
}

TEST_F(BatchResolverTest, OverlappingTokensAreKept) {
    auto targets = batch.resolve_list("10.0.0.2,10.0.0.1-10.0.0.3", "");
    std::vector<std::string> expected = {"10.0.0.2", "10.0.0.1", "10.0.0.2", "10.0.0.3"};
    EXPECT_EQ(addresses(targets), expected);
}

TEST_F(BatchResolverTest, EmptyResultFails) {
    EXPECT_THROW(batch.resolve_list("", "80"), EmptyTargetSetError);
    EXPECT_THROW(batch.resolve_list(" , ", "80"), EmptyTargetSetError);
    // the only answer is IPv6 while IPv4 is preferred
    EXPECT_THROW(batch.resolve_list("empty.net", "80"), EmptyTargetSetError);
}

TEST_F(BatchResolverTest, FirstErrorAbortsTheList) {
    EXPECT_THROW(batch.resolve_list("10.0.0.1,bogus.notatld,10.0.0.2", ""), AddressClassificationError);
    EXPECT_THROW(batch.resolve_list("10.0.0.1", "90-80"), PortParseError);
    EXPECT_THROW(batch.resolve_list("10.0.0.9-10.0.0.1", ""), RangeOrderError);
}

TEST_F(BatchResolverTest, PortsAreParsedBeforeDns) {
    EXPECT_THROW(batch.resolve_list("example.com", "x"), PortParseError);
    EXPECT_TRUE(resolver.queries.empty());
}

TEST_F(BatchResolverTest, PortSetIsLoggedAtDebug) {
    set_log_level(LogLevel::Debug);
    ::testing::internal::CaptureStderr();
    batch.resolve_list("10.0.0.1", "22,80-81");
    std::string log = ::testing::internal::GetCapturedStderr();
    set_log_level(LogLevel::Warning);
    EXPECT_NE(log.find("DEBUG: ports 22,80,81"), std::string::npos);
}

TEST_F(BatchResolverTest, FileLinesInOrder) {
    std::string path = write_file("netrecon_targets.txt",
                                  "10.0.0.5\r\n\n10.0.0.1-10.0.0.2\nexample.com, 10.0.0.9\n\n\n");
    auto targets = batch.resolve_file(path, "22");
    std::vector<std::string> expected = {"10.0.0.5", "10.0.0.1", "10.0.0.2", "93.184.216.34", "10.0.0.9"};
    EXPECT_EQ(addresses(targets), expected);
    for (const auto &t : targets)
        EXPECT_EQ(t.ports, PortSet{22});
}

TEST_F(BatchResolverTest, MissingFile) {
    EXPECT_THROW(batch.resolve_file(::testing::TempDir() + "netrecon_does_not_exist.txt", ""), IOError);
}

TEST_F(BatchResolverTest, MalformedLineAbortsTheFile) {
    std::string path = write_file("netrecon_bad.txt", "10.0.0.1\n10.0.0.300\n10.0.0.2\n");
    EXPECT_THROW(batch.resolve_file(path, ""), AddressClassificationError);
}

TEST_F(BatchResolverTest, BlankFileFails) {
    std::string path = write_file("netrecon_blank.txt", "\n  \n");
    EXPECT_THROW(batch.resolve_file(path, ""), EmptyTargetSetError);
}

TEST_F(BatchResolverTest, DedupeKeepsFirstOrigin) {
    auto targets = batch.resolve_list("10.0.0.1-10.0.0.2,10.0.0.2,10.0.0.0/30", "80");
    auto unique = dedupe_targets(targets);
    std::vector<std::string> expected = {"10.0.0.1", "10.0.0.2", "10.0.0.0", "10.0.0.3"};
    EXPECT_EQ(addresses(unique), expected);
    EXPECT_EQ(unique[1].origin.value_or(""), "10.0.0.1-10.0.0.2");
    EXPECT_EQ(unique[2].origin.value_or(""), "10.0.0.0/30");
}

TEST_F(BatchResolverTest, DedupeComparesPorts) {
    std::vector<Target> targets = {
        {*IpAddress::parse("10.0.0.1"), {80}, std::nullopt},
        {*IpAddress::parse("10.0.0.1"), {443}, std::nullopt},
        {*IpAddress::parse("10.0.0.1"), {80}, std::string("10.0.0.0/24")},
    };
    auto unique = dedupe_targets(targets);
    ASSERT_EQ(unique.size(), 2u);
    EXPECT_FALSE(unique[0].origin.has_value());
}
