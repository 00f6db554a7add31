#include "PortSpec.hpp"
#include "Errors.hpp"
#include "Utils.hpp"
#include <set>

/**
 * @brief Converts one port bound to a number.
 *
 * @param token Trimmed bound text.
 * @param segment The whole segment, quoted in the error message.
 * @return The port number.
 */
static uint16_t parse_port_number(const std::string &token, const std::string &segment) {
    // at most 5 digits, so std::stoul cannot overflow
    if (!isDigits(token) || token.size() > 5)
        throw PortParseError("invalid port '" + token + "' in '" + segment + "'");
    unsigned long value = std::stoul(token);
    if (value > 65535)
        throw PortParseError("port " + token + " out of range in '" + segment + "'");
    return static_cast<uint16_t>(value);
}

PortSet parse_ports(const std::string &spec) {
    PortSet ports;
    std::set<uint16_t> seen;
    auto add = [&](uint16_t port) {
        if (seen.insert(port).second)
            ports.push_back(port);
    };

    for (const std::string &segment : split(spec, ',')) {
        size_t dash = segment.find('-');
        if (dash == std::string::npos) {
            add(parse_port_number(segment, segment));
            continue;
        }

        std::string first = trim(segment.substr(0, dash));
        std::string second = trim(segment.substr(dash + 1));
        if (first.empty() || second.empty())
            throw PortParseError("incomplete port range '" + segment + "'");
        uint16_t start = parse_port_number(first, segment);
        uint16_t end = parse_port_number(second, segment);
        if (start >= end)
            throw PortParseError("port range '" + segment + "': " + first +
                                 "(start) >= " + second + "(end)");
        for (uint32_t port = start; port <= end; ++port)
            add(static_cast<uint16_t>(port));
    }
    return ports;
}

std::string ports_to_string(const PortSet &ports) {
    std::string out;
    for (uint16_t port : ports) {
        if (!out.empty()) out += ',';
        out += std::to_string(port);
    }
    return out;
}
