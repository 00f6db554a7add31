#pragma once
#include <string>

enum class AddressKind {
    Ipv4Literal,
    Ipv6Literal,
    Ipv4Subnet,
    Ipv6Subnet,
    Ipv4Range,
    Ipv6Range,
    Domain
};

/**
 * @brief Decides what kind of address token the user typed.
 *
 * Address forms win over domain names: "10.0.0.1", "10.0.0.0/24",
 * "10.0.0.1-10.0.0.9" and their IPv6 counterparts are recognised first,
 * anything else must end in a listed top-level domain.
 *
 * @param token One address token, surrounding whitespace ignored.
 * @return The kind of the token.
 * @throws AddressClassificationError if the token matches no form.
 */
AddressKind classify(const std::string &token);

const char *address_kind_name(AddressKind kind);

/**
 * Splits "addr/prefix" and validates both halves.
 *
 * @param token Subnet token.
 * @param v6 Whether the address half must be IPv6.
 * @param address Receives the address half.
 * @param prefix Receives the prefix length.
 * @return false if the token is not a valid CIDR block of that family.
 */
bool split_subnet(const std::string &token, bool v6, std::string &address, int &prefix);

/**
 * Splits "start-end" on the first '-' and trims both endpoints.
 *
 * @return false if there is no '-' or an endpoint is empty.
 */
bool split_range(const std::string &token, std::string &start, std::string &end);
