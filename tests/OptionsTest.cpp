#include "Errors.hpp"
#include "Options.hpp"
#include <gtest/gtest.h>
#include <string>
#include <vector>

/** Builds a mutable argv for getopt_long. */
class Argv {
public:
    Argv(std::initializer_list<const char *> args) {
        for (const char *a : args)
            storage.emplace_back(a);
        for (auto &s : storage)
            pointers.push_back(&s[0]);
        pointers.push_back(nullptr);
    }
    int argc() const { return static_cast<int>(storage.size()); }
    char **argv() { return pointers.data(); }

private:
    std::vector<std::string> storage;
    std::vector<char *> pointers;
};

TEST(OptionsTest, Defaults) {
    Argv args{"netrecon", "-t", "10.0.0.1"};
    Options opts = parse_arguments(args.argc(), args.argv());
    EXPECT_EQ(opts.target, "10.0.0.1");
    EXPECT_TRUE(opts.filename.empty());
    EXPECT_EQ(opts.method, ScanMethod::ConnectPing);
    EXPECT_DOUBLE_EQ(opts.timeout, 1.0);
    EXPECT_EQ(opts.threads, 64u);
    EXPECT_EQ(opts.attempts, 2);
    EXPECT_FALSE(opts.ipv6);
    EXPECT_FALSE(opts.dedup);
    EXPECT_EQ(opts.log_level, LogLevel::Warning);
}

TEST(OptionsTest, FullPortScan) {
    Argv args{"netrecon", "--sT", "-p", "22,80-82", "-w", "0.5", "--threads", "8",
              "--attempts", "3", "--ipv6", "--dedup", "-vv", "-i", "eth0", "example.com"};
    Options opts = parse_arguments(args.argc(), args.argv());
    EXPECT_EQ(opts.method, ScanMethod::TcpConnect);
    EXPECT_EQ(opts.ports, "22,80-82");
    EXPECT_DOUBLE_EQ(opts.timeout, 0.5);
    EXPECT_EQ(opts.threads, 8u);
    EXPECT_EQ(opts.attempts, 3);
    EXPECT_TRUE(opts.ipv6);
    EXPECT_TRUE(opts.dedup);
    EXPECT_EQ(opts.interface, "eth0");
    EXPECT_EQ(opts.target, "example.com");
    EXPECT_EQ(opts.log_level, LogLevel::Debug);

    ScanConfig config = scan_config(opts);
    EXPECT_EQ(config.method, ScanMethod::TcpConnect);
    EXPECT_EQ(config.threads, 8u);
    EXPECT_EQ(config.max_attempts, 3);
    EXPECT_FALSE(config.source.has_value());
}

TEST(OptionsTest, FileAndOsDetection) {
    Argv args{"netrecon", "-f", "hosts.txt", "-O", "-q"};
    Options opts = parse_arguments(args.argc(), args.argv());
    EXPECT_EQ(opts.filename, "hosts.txt");
    EXPECT_EQ(opts.method, ScanMethod::OsDetect);
    EXPECT_EQ(opts.log_level, LogLevel::Error);
}

TEST(OptionsTest, LoneInterfaceListsDevices) {
    Argv args{"netrecon", "-i"};
    EXPECT_TRUE(parse_arguments(args.argc(), args.argv()).list_interfaces);
    Argv longer{"netrecon", "--interface"};
    EXPECT_TRUE(parse_arguments(longer.argc(), longer.argv()).list_interfaces);
}

TEST(OptionsTest, Help) {
    Argv args{"netrecon", "-h"};
    EXPECT_TRUE(parse_arguments(args.argc(), args.argv()).help);
}

TEST(OptionsTest, HelpMarksRawSocketMethods) {
    ::testing::internal::CaptureStdout();
    print_help("netrecon");
    std::string text = ::testing::internal::GetCapturedStdout();
    size_t raw = text.find("not supported by the connect engine");
    ASSERT_NE(raw, std::string::npos);
    EXPECT_LT(text.find("--sT"), raw);
    EXPECT_GT(text.find("--sS"), raw);
    EXPECT_GT(text.find("--os"), raw);
    EXPECT_EQ(text.find("top-k"), std::string::npos);
}

TEST(OptionsTest, Rejected) {
    Argv none{"netrecon", "-p", "80"};
    EXPECT_THROW(parse_arguments(none.argc(), none.argv()), OptionError);

    Argv both{"netrecon", "-t", "10.0.0.1", "-f", "x.txt"};
    EXPECT_THROW(parse_arguments(both.argc(), both.argv()), OptionError);

    Argv methods{"netrecon", "--sn", "--sT", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(methods.argc(), methods.argv()), OptionError);

    Argv timeout{"netrecon", "-w", "soon", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(timeout.argc(), timeout.argv()), OptionError);

    Argv threads{"netrecon", "--threads", "0", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(threads.argc(), threads.argv()), OptionError);

    Argv unknown{"netrecon", "--bogus", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(unknown.argc(), unknown.argv()), OptionError);

    Argv extra{"netrecon", "-t", "10.0.0.1", "10.0.0.2"};
    EXPECT_THROW(parse_arguments(extra.argc(), extra.argv()), OptionError);
}

TEST(OptionsTest, TimeoutIsBounded) {
    Argv hour{"netrecon", "-w", "3600", "-t", "10.0.0.1"};
    EXPECT_DOUBLE_EQ(parse_arguments(hour.argc(), hour.argv()).timeout, 3600.0);

    Argv huge{"netrecon", "-w", "1e12", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(huge.argc(), huge.argv()), OptionError);

    Argv overflow{"netrecon", "-w", "1e400", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(overflow.argc(), overflow.argv()), OptionError);

    Argv nan{"netrecon", "-w", "nan", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(nan.argc(), nan.argv()), OptionError);
}

TEST(OptionsTest, CountsMustFitAnInt) {
    Argv wraps{"netrecon", "--attempts", "4294967296", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(wraps.argc(), wraps.argv()), OptionError);

    Argv threads{"netrecon", "--threads", "2147483648", "-t", "10.0.0.1"};
    EXPECT_THROW(parse_arguments(threads.argc(), threads.argv()), OptionError);

    Argv largest{"netrecon", "--attempts", "2147483647", "-t", "10.0.0.1"};
    EXPECT_EQ(parse_arguments(largest.argc(), largest.argv()).attempts, 2147483647);
}

TEST(OptionsTest, ScanMethodNames) {
    EXPECT_EQ(scan_method_name(ScanMethod::TcpConnect), "tcp connect scan");
    EXPECT_TRUE(is_host_discovery(ScanMethod::Mac));
    EXPECT_FALSE(is_host_discovery(ScanMethod::OsDetect));
}
