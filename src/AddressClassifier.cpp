#include "AddressClassifier.hpp"
#include "Errors.hpp"
#include "IpAddress.hpp"
#include "TldRegistry.hpp"
#include "Utils.hpp"

static bool only_ipv4_chars(const std::string &token) {
    for (char c : token) {
        if (!((c >= '0' && c <= '9') || c == '.' || c == '/')) {
            return false;
        }
    }
    return true;
}

bool split_subnet(const std::string &token, bool v6, std::string &address, int &prefix) {
    size_t slash = token.find('/');
    if (slash == std::string::npos) return false;
    address = trim(token.substr(0, slash));
    std::string bits = trim(token.substr(slash + 1));
    if (!isDigits(bits) || bits.size() > 3) return false;
    prefix = std::stoi(bits);
    if (v6)
        return prefix <= 128 && IpAddress::parse_v6(address).has_value();
    return prefix <= 32 && IpAddress::parse_v4(address).has_value();
}

bool split_range(const std::string &token, std::string &start, std::string &end) {
    size_t dash = token.find('-');
    if (dash == std::string::npos) return false;
    start = trim(token.substr(0, dash));
    end = trim(token.substr(dash + 1));
    return !start.empty() && !end.empty();
}

static bool looks_like_domain(const std::string &token) {
    std::string name = token;
    if (!name.empty() && name.back() == '.')
        name.pop_back();
    size_t dot = name.rfind('.');
    if (dot == std::string::npos) return false;
    return TldRegistry::contains(trim(name.substr(dot + 1)));
}

AddressKind classify(const std::string &raw) {
    std::string token = trim(raw);
    bool has_colon = token.find(':') != std::string::npos;
    bool has_dash = token.find('-') != std::string::npos;
    bool has_slash = token.find('/') != std::string::npos;
    std::string address;
    int prefix = 0;

    if (has_colon && !has_dash) {
        if (!has_slash && IpAddress::parse_v6(token))
            return AddressKind::Ipv6Literal;
        if (has_slash && split_subnet(token, true, address, prefix))
            return AddressKind::Ipv6Subnet;
    }

    if (!token.empty() && only_ipv4_chars(token)) {
        if (has_slash && split_subnet(token, false, address, prefix))
            return AddressKind::Ipv4Subnet;
        if (!has_slash && IpAddress::parse_v4(token))
            return AddressKind::Ipv4Literal;
    }

    std::string start, end;
    if (has_dash && split_range(token, start, end)) {
        if (IpAddress::parse_v4(start) && IpAddress::parse_v4(end))
            return AddressKind::Ipv4Range;
        bool v6_hint = start.find(':') != std::string::npos || end.find(':') != std::string::npos;
        if (v6_hint && IpAddress::parse_v6(start) && IpAddress::parse_v6(end))
            return AddressKind::Ipv6Range;
    }

    if (looks_like_domain(token))
        return AddressKind::Domain;

    throw AddressClassificationError("can not parse target '" + token +
                                     "': not an address, subnet, range or known domain");
}

const char *address_kind_name(AddressKind kind) {
    switch (kind) {
        case AddressKind::Ipv4Literal: return "ipv4";
        case AddressKind::Ipv6Literal: return "ipv6";
        case AddressKind::Ipv4Subnet:  return "ipv4 subnet";
        case AddressKind::Ipv6Subnet:  return "ipv6 subnet";
        case AddressKind::Ipv4Range:   return "ipv4 range";
        case AddressKind::Ipv6Range:   return "ipv6 range";
        case AddressKind::Domain:      return "domain";
    }
    return "unknown";
}
