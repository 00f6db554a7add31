#include "TargetExpander.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "Utils.hpp"

TargetExpander::TargetExpander(Resolver &r, AddressFamilyPreference preference)
    : resolver(r), family_preference(preference) {}

std::vector<Target> TargetExpander::expand(const std::string &raw, const PortSet &ports) const {
    std::string token = trim(raw);
    AddressKind kind = classify(token);
    log_debug("target " + token + " is " + address_kind_name(kind));

    switch (kind) {
        case AddressKind::Ipv4Literal: return expand_literal(token, false, ports);
        case AddressKind::Ipv6Literal: return expand_literal(token, true, ports);
        case AddressKind::Ipv4Subnet:  return expand_subnet(token, false, ports);
        case AddressKind::Ipv6Subnet:  return expand_subnet(token, true, ports);
        case AddressKind::Ipv4Range:   return expand_range(token, false, ports);
        case AddressKind::Ipv6Range:   return expand_range(token, true, ports);
        case AddressKind::Domain:      return expand_domain(token, ports);
    }
    throw AddressClassificationError("can not parse target '" + token + "'");
}

std::vector<Target> TargetExpander::expand_literal(const std::string &token, bool v6,
                                                   const PortSet &ports) const {
    std::optional<IpAddress> ip = v6 ? IpAddress::parse_v6(token) : IpAddress::parse_v4(token);
    if (!ip)
        throw AddressClassificationError("can not convert target " + token +
                                         (v6 ? " to an IPv6 address" : " to an IPv4 address"));
    return {Target{*ip, ports, std::nullopt}};
}

std::vector<Target> TargetExpander::expand_subnet(const std::string &token, bool v6,
                                                  const PortSet &ports) const {
    std::string address;
    int prefix = 0;
    if (!split_subnet(token, v6, address, prefix))
        throw AddressClassificationError("invalid subnet " + token);

    IpAddress base = *IpAddress::parse(address);
    return enumerate(base.network(prefix), base.last(prefix), token, ports);
}

std::vector<Target> TargetExpander::expand_range(const std::string &token, bool v6,
                                                 const PortSet &ports) const {
    std::string first, second;
    if (!split_range(token, first, second))
        throw AddressClassificationError("invalid address range " + token);

    std::optional<IpAddress> start = v6 ? IpAddress::parse_v6(first) : IpAddress::parse_v4(first);
    std::optional<IpAddress> end = v6 ? IpAddress::parse_v6(second) : IpAddress::parse_v4(second);
    if (!start || !end)
        throw AddressClassificationError("invalid address range " + token);
    if (*end < *start)
        throw RangeOrderError("address range " + token + ": start must precede end");
    return enumerate(*start, *end, token, ports);
}

std::vector<Target> TargetExpander::expand_domain(const std::string &token,
                                                  const PortSet &ports) const {
    bool want_v6 = family_preference == AddressFamilyPreference::IPv6First;
    std::vector<Target> targets;
    for (const IpAddress &ip : resolver.resolve(token)) {
        if (ip.is_v6() == want_v6)
            targets.push_back(Target{ip, ports, token});
    }
    if (targets.empty())
        log_warning("domain " + token + " has no " + (want_v6 ? "IPv6" : "IPv4") + " address");
    return targets;
}

std::vector<Target> TargetExpander::enumerate(const IpAddress &first, const IpAddress &last,
                                              const std::string &origin,
                                              const PortSet &ports) const {
    IpAddress::u128 start = first.value();
    IpAddress::u128 end = last.value();
    // end - start cannot overflow, end - start + 1 can for ::/0
    if (end - start >= max_expansion)
        throw TargetLimitError("target " + origin + " expands to more than " +
                               std::to_string(static_cast<unsigned long long>(max_expansion)) +
                               " addresses");

    std::vector<Target> targets;
    targets.reserve(static_cast<size_t>(end - start + 1));
    for (IpAddress::u128 v = start; ; ++v) {
        targets.push_back(Target{IpAddress::from_value(first.family(), v), ports, origin});
        if (v == end) break;
    }
    return targets;
}
