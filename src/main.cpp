#include "BatchResolver.hpp"
#include "ConnectEngine.hpp"
#include "Errors.hpp"
#include "Interfaces.hpp"
#include "Log.hpp"
#include "Options.hpp"
#include "Resolver.hpp"
#include "ResultAggregator.hpp"
#include "TargetExpander.hpp"
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <ctime>
#include <exception>
#include <iostream>

#ifndef NETRECON_VERSION
#define NETRECON_VERSION "0.0.0"
#endif

/**
 * @brief Signal handler to exit on SIGINT (Ctrl+C).
 */
void signal_handler(int) {
    std::exit(130);
}

/**
 * @brief Prints capture devices and their addresses, one device per line.
 */
static void show_interfaces() {
    for (const CaptureInterface &iface : list_interfaces()) {
        std::cout << iface.name;
        for (const IpAddress &ip : iface.addresses)
            std::cout << " " << ip.to_string();
        if (!iface.description.empty())
            std::cout << " (" << iface.description << ")";
        std::cout << std::endl;
    }
}

static void print_banner() {
    char stamp[64] = "";
    std::time_t now = std::time(nullptr);
    if (const std::tm *local = std::localtime(&now))
        std::strftime(stamp, sizeof(stamp), "%Y-%m-%d %H:%M %Z", local);
    std::cout << "Starting netrecon " << NETRECON_VERSION << " at " << stamp << std::endl;
}

/**
 * @brief Resolves the targets, runs the engine and prints the report.
 *
 * @param opts Parsed command-line options.
 * @return int Exit status code.
 */
static int run(const Options &opts) {
    SystemResolver resolver;
    AddressFamilyPreference preference =
        opts.ipv6 ? AddressFamilyPreference::IPv6First : AddressFamilyPreference::IPv4First;
    TargetExpander expander(resolver, preference);
    BatchResolver batch(expander);

    std::vector<Target> targets = opts.filename.empty()
        ? batch.resolve_list(opts.target, opts.ports)
        : batch.resolve_file(opts.filename, opts.ports);
    if (opts.dedup)
        targets = dedupe_targets(targets);
    log_info(std::to_string(targets.size()) + " targets resolved");

    ScanConfig config = scan_config(opts);
    if (!opts.interface.empty())
        config.source = source_address(opts.interface, targets.front().address.family());

    ConnectEngine engine;
    auto start = std::chrono::steady_clock::now();
    std::vector<ResultRecord> records = engine.run(targets, config);
    std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;

    Report report = aggregate(records, ScanSummary{targets.size(), elapsed.count()});
    print_banner();
    std::cout << report.str() << std::endl;
    return 0;
}

/**
 * @brief Entry point of the program. Parses arguments and starts the scan.
 *
 * @param argc Argument count.
 * @param argv Argument vector.
 * @return int Exit status code.
 */
int main(int argc, char *argv[]) {
    std::signal(SIGINT, signal_handler);

    try {
        if (argc == 1) {
            show_interfaces();
            return 0;
        }
        Options opts = parse_arguments(argc, argv);
        if (opts.help) {
            print_help(argv[0]);
            return 0;
        }
        if (opts.list_interfaces) {
            show_interfaces();
            return 0;
        }
        set_log_level(opts.log_level);
        return run(opts);
    } catch (const OptionError &e) {
        log_error(e.what());
        print_help(argv[0]);
        return 1;
    } catch (const ReconError &e) {
        log_error(e.what());
        return 1;
    } catch (const std::exception &e) {
        log_error(e.what());
        return 1;
    }
}
