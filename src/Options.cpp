#include "Options.hpp"
#include "Errors.hpp"
#include <climits>
#include <cstring>
#include <getopt.h>
#include <iostream>
#include <stdexcept>

void print_help(const char *prog) {
    std::cout << std::endl;
    std::cout << "Usage: " << prog << " [-t <targets> | -f <file>] [-p <ports>] [method] [options]\n";
    std::cout << "       targets:           10.0.0.1, 10.0.0.0/24, 10.0.0.1-10.0.0.9, 2001:db8::/120," << std::endl;
    std::cout << "                          example.com or a comma list of those" << std::endl;
    std::cout << "       -f, --file:        read targets from a file, one spec per line" << std::endl;
    std::cout << "       -p, --ports:       ports, e.g. 22,80,443-445" << std::endl;
    std::cout << std::endl;
    std::cout << "Methods:" << std::endl;
    std::cout << "       --sn               tcp connect ping (default)" << std::endl;
    std::cout << "       --sT               tcp connect scan" << std::endl;
    std::cout << std::endl;
    std::cout << "Raw socket methods (recognised, not supported by the connect engine):" << std::endl;
    std::cout << "       --PE               icmp echo ping" << std::endl;
    std::cout << "       --PS               tcp syn ping" << std::endl;
    std::cout << "       --mac              arp / ndp scan" << std::endl;
    std::cout << "       --sS               tcp syn scan" << std::endl;
    std::cout << "       --sU               udp scan" << std::endl;
    std::cout << "       -O, --os           os detection" << std::endl;
    std::cout << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "       -w, --timeout <s>  probe timeout in seconds, at most 3600 (default 1.0)" << std::endl;
    std::cout << "       --threads <n>      worker threads (default 64)" << std::endl;
    std::cout << "       --attempts <n>     attempts per probe (default 2)" << std::endl;
    std::cout << "       --ipv6             keep the IPv6 addresses of domain names" << std::endl;
    std::cout << "       --dedup            drop repeated address/port targets" << std::endl;
    std::cout << "       -i, --interface    source interface; alone, lists interfaces" << std::endl;
    std::cout << "       -v, -q             more / less diagnostics" << std::endl;
    std::cout << "       -h, --help         show this help" << std::endl;
}

static double to_double(const char *arg, const char *what) {
    try {
        size_t used = 0;
        double value = std::stod(arg, &used);
        if (used != std::strlen(arg) || !(value > 0))
            throw std::invalid_argument(arg);
        if (value > ScanConfig::max_timeout)
            throw std::out_of_range(arg);
        return value;
    } catch (const std::logic_error&) {
        throw OptionError(std::string("invalid ") + what + " '" + arg + "'");
    }
}

static unsigned long to_count(const char *arg, const char *what) {
    try {
        size_t used = 0;
        if (arg[0] == '-')
            throw std::invalid_argument(arg);
        unsigned long value = std::stoul(arg, &used);
        if (used != std::strlen(arg) || value == 0)
            throw std::invalid_argument(arg);
        if (value > static_cast<unsigned long>(INT_MAX))
            throw std::out_of_range(arg);
        return value;
    } catch (const std::logic_error&) {
        throw OptionError(std::string("invalid ") + what + " '" + arg + "'");
    }
}

enum LongOnly {
    OPT_SN = 256,
    OPT_ST,
    OPT_SS,
    OPT_SU,
    OPT_PE,
    OPT_PS,
    OPT_MAC,
    OPT_THREADS,
    OPT_ATTEMPTS,
    OPT_IPV6,
    OPT_DEDUP
};

Options parse_arguments(int argc, char *argv[]) {
    Options opts;
    if (argc == 2 && (std::strcmp(argv[1], "-i") == 0 || std::strcmp(argv[1], "--interface") == 0)) {
        opts.list_interfaces = true;
        return opts;
    }

    struct option long_options[] = {
        {"target", required_argument, nullptr, 't'},
        {"file", required_argument, nullptr, 'f'},
        {"ports", required_argument, nullptr, 'p'},
        {"interface", required_argument, nullptr, 'i'},
        {"timeout", required_argument, nullptr, 'w'},
        {"os", no_argument, nullptr, 'O'},
        {"help", no_argument, nullptr, 'h'},
        {"sn", no_argument, nullptr, OPT_SN},
        {"sT", no_argument, nullptr, OPT_ST},
        {"sS", no_argument, nullptr, OPT_SS},
        {"sU", no_argument, nullptr, OPT_SU},
        {"PE", no_argument, nullptr, OPT_PE},
        {"PS", no_argument, nullptr, OPT_PS},
        {"mac", no_argument, nullptr, OPT_MAC},
        {"threads", required_argument, nullptr, OPT_THREADS},
        {"attempts", required_argument, nullptr, OPT_ATTEMPTS},
        {"ipv6", no_argument, nullptr, OPT_IPV6},
        {"dedup", no_argument, nullptr, OPT_DEDUP},
        {nullptr, 0, nullptr, 0}
    };

    bool method_set = false;
    auto set_method = [&](ScanMethod method) {
        if (method_set && opts.method != method)
            throw OptionError("only one scan method may be given");
        opts.method = method;
        method_set = true;
    };

    // reset getopt so the parser can run more than once per process
    optind = 0;
    opterr = 0;
    int verbosity = static_cast<int>(LogLevel::Warning);
    int opt;
    while ((opt = getopt_long(argc, argv, "t:f:p:i:w:Ovqh", long_options, nullptr)) != -1) {
        switch (opt) {
            case 't': opts.target = optarg; break;
            case 'f': opts.filename = optarg; break;
            case 'p': opts.ports = optarg; break;
            case 'i': opts.interface = optarg; break;
            case 'w': opts.timeout = to_double(optarg, "timeout"); break;
            case 'O': set_method(ScanMethod::OsDetect); break;
            case 'v': verbosity++; break;
            case 'q': verbosity--; break;
            case 'h': opts.help = true; return opts;
            case OPT_SN: set_method(ScanMethod::ConnectPing); break;
            case OPT_ST: set_method(ScanMethod::TcpConnect); break;
            case OPT_SS: set_method(ScanMethod::TcpSyn); break;
            case OPT_SU: set_method(ScanMethod::Udp); break;
            case OPT_PE: set_method(ScanMethod::IcmpEcho); break;
            case OPT_PS: set_method(ScanMethod::TcpSynPing); break;
            case OPT_MAC: set_method(ScanMethod::Mac); break;
            case OPT_THREADS: opts.threads = to_count(optarg, "thread count"); break;
            case OPT_ATTEMPTS: opts.attempts = static_cast<int>(to_count(optarg, "attempt count")); break;
            case OPT_IPV6: opts.ipv6 = true; break;
            case OPT_DEDUP: opts.dedup = true; break;
            default:
                throw OptionError("Invalid argument!");
        }
    }

    if (optind < argc) {
        if (!opts.target.empty() || optind + 1 < argc)
            throw OptionError(std::string("unexpected argument '") + argv[optind] + "'");
        opts.target = argv[optind];
    }
    if (opts.target.empty() && opts.filename.empty())
        throw OptionError("No target specified!");
    if (!opts.target.empty() && !opts.filename.empty())
        throw OptionError("use either a target or a target file, not both");

    if (verbosity < static_cast<int>(LogLevel::Error)) verbosity = static_cast<int>(LogLevel::Error);
    if (verbosity > static_cast<int>(LogLevel::Debug)) verbosity = static_cast<int>(LogLevel::Debug);
    opts.log_level = static_cast<LogLevel>(verbosity);
    return opts;
}

ScanConfig scan_config(const Options &opts) {
    ScanConfig config;
    config.method = opts.method;
    config.timeout = opts.timeout;
    config.threads = opts.threads;
    config.max_attempts = opts.attempts;
    return config;
}
