#pragma once
#include "IpAddress.hpp"
#include "PortSpec.hpp"
#include <optional>
#include <string>

/**
 * @brief One concrete scan endpoint.
 *
 * origin holds the range, subnet or domain token the address was expanded
 * from and is empty when the user typed the literal address.
 */
struct Target {
    IpAddress address;
    PortSet ports;
    std::optional<std::string> origin;
};

/** Which resolved address family a domain name keeps. */
enum class AddressFamilyPreference {
    IPv4First,
    IPv6First
};
