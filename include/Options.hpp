#pragma once
#include "Log.hpp"
#include "ScanEngine.hpp"
#include <cstddef>
#include <string>

struct Options {
    std::string target;
    std::string filename;
    std::string ports;
    std::string interface;

    ScanMethod method = ScanMethod::ConnectPing;
    double timeout = 1.0;
    size_t threads = 64;
    int attempts = 2;

    bool ipv6 = false;
    bool dedup = false;
    bool list_interfaces = false;
    bool help = false;
    LogLevel log_level = LogLevel::Warning;
};

/**
 * Prints out help for program execute.
 *
 * @param prog Program name shown in the usage line.
 */
void print_help(const char *prog);

/**
 * Parses the command-line arguments into an Options struct.
 * Supported arguments:
 *
 *   -t, --target <spec>    address, subnet, range, domain or comma list
 *
 *   -f, --file <path>      one target spec per line (same as nmap -iL)
 *
 *   -p, --ports <spec>     e.g. 22,80,443-445
 *
 *   --sn, --PE, --PS, --mac       host discovery method (default --sn)
 *
 *   --sT, --sS, --sU, -O/--os     port scan or OS detection method
 *
 *   -w/--timeout <seconds>, --threads <n>, --attempts <n>
 *
 *   --ipv6, --dedup, -i/--interface <name>, -v, -q, -h
 *
 * A lone -i (or --interface) asks for the device list. A trailing
 * positional argument is taken as the target.
 *
 * @param argc Number of command-line arguments.
 * @param argv Array of command-line argument strings.
 * @return Options struct populated with the parsed values.
 * @throws OptionError on unknown options, bad numbers or missing targets.
 */
Options parse_arguments(int argc, char *argv[]);

/** Engine settings taken from the options, without a source address. */
ScanConfig scan_config(const Options &opts);
