#include "IpAddress.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <cstring>

static IpAddress::u128 host_mask(int bits, int prefix) {
    if (prefix >= bits) return 0;
    IpAddress::u128 all = (bits == 128) ? ~IpAddress::u128(0) : ((IpAddress::u128(1) << bits) - 1);
    if (prefix <= 0) return all;
    return all >> prefix;
}

IpAddress::IpAddress() : family_(IpFamily::V4), bytes_{} {}

std::optional<IpAddress> IpAddress::parse_v4(const std::string &text) {
    struct in_addr addr{};
    if (inet_pton(AF_INET, text.c_str(), &addr) != 1)
        return std::nullopt;
    IpAddress ip;
    ip.family_ = IpFamily::V4;
    std::memcpy(ip.bytes_.data(), &addr, sizeof(addr));
    return ip;
}

std::optional<IpAddress> IpAddress::parse_v6(const std::string &text) {
    struct in6_addr addr{};
    if (inet_pton(AF_INET6, text.c_str(), &addr) != 1)
        return std::nullopt;
    IpAddress ip;
    ip.family_ = IpFamily::V6;
    std::memcpy(ip.bytes_.data(), &addr, sizeof(addr));
    return ip;
}

std::optional<IpAddress> IpAddress::parse(const std::string &text) {
    if (text.find(':') != std::string::npos)
        return parse_v6(text);
    return parse_v4(text);
}

IpAddress IpAddress::from_v4(uint32_t value) {
    return from_value(IpFamily::V4, value);
}

IpAddress IpAddress::from_value(IpFamily family, u128 value) {
    IpAddress ip;
    ip.family_ = family;
    int len = (family == IpFamily::V4) ? 4 : 16;
    for (int i = len - 1; i >= 0; --i) {
        ip.bytes_[i] = static_cast<uint8_t>(value & 0xff);
        value >>= 8;
    }
    return ip;
}

IpAddress::u128 IpAddress::value() const {
    u128 v = 0;
    int len = is_v4() ? 4 : 16;
    for (int i = 0; i < len; ++i)
        v = (v << 8) | bytes_[i];
    return v;
}

IpAddress IpAddress::network(int prefix) const {
    return from_value(family_, value() & ~host_mask(bits(), prefix));
}

IpAddress IpAddress::last(int prefix) const {
    return from_value(family_, value() | host_mask(bits(), prefix));
}

std::string IpAddress::to_string() const {
    char buf[INET6_ADDRSTRLEN];
    int af = is_v4() ? AF_INET : AF_INET6;
    if (!inet_ntop(af, bytes_.data(), buf, sizeof(buf)))
        return "";
    return buf;
}

bool IpAddress::operator==(const IpAddress &other) const {
    return family_ == other.family_ && bytes_ == other.bytes_;
}

bool IpAddress::operator<(const IpAddress &other) const {
    if (family_ != other.family_)
        return is_v4();
    return bytes_ < other.bytes_;
}
