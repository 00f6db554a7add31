#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <string>

enum class IpFamily {
    V4,
    V6
};

/**
 * A single IPv4 or IPv6 address.
 *
 * Addresses order numerically inside a family and every IPv4 address orders
 * before every IPv6 address.
 */
class IpAddress {
public:
    using u128 = unsigned __int128;

    IpAddress();

    /**
     * Parses a dotted-quad IPv4 literal.
     *
     * @param text The literal, without surrounding whitespace.
     * @return The address, or std::nullopt when text is not a valid literal.
     */
    static std::optional<IpAddress> parse_v4(const std::string &text);

    /**
     * Parses an IPv6 literal in any form inet_pton accepts.
     *
     * @param text The literal, without surrounding whitespace.
     * @return The address, or std::nullopt when text is not a valid literal.
     */
    static std::optional<IpAddress> parse_v6(const std::string &text);

    /** Tries IPv6 when text contains ':', IPv4 otherwise. */
    static std::optional<IpAddress> parse(const std::string &text);

    static IpAddress from_v4(uint32_t value);
    static IpAddress from_value(IpFamily family, u128 value);

    IpFamily family() const { return family_; }
    bool is_v4() const { return family_ == IpFamily::V4; }
    bool is_v6() const { return family_ == IpFamily::V6; }

    /** Address width in bits, 32 or 128. */
    int bits() const { return is_v4() ? 32 : 128; }

    /** Numeric value, IPv4 in the low 32 bits. */
    u128 value() const;

    /**
     * First address of the CIDR block of the given prefix length.
     *
     * @param prefix Prefix length, at most bits().
     */
    IpAddress network(int prefix) const;

    /** Last address of the CIDR block of the given prefix length. */
    IpAddress last(int prefix) const;

    std::string to_string() const;

    bool operator==(const IpAddress &other) const;
    bool operator!=(const IpAddress &other) const { return !(*this == other); }
    bool operator<(const IpAddress &other) const;

private:
    IpFamily family_;
    std::array<uint8_t, 16> bytes_;  // network order, IPv4 uses the first 4
};
