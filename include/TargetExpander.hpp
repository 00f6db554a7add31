#pragma once
#include "AddressClassifier.hpp"
#include "Resolver.hpp"
#include "Target.hpp"
#include <string>
#include <vector>

/**
 * @brief Expands one address token into concrete targets.
 *
 * - literal: one target without origin
 * - subnet: every address of the CIDR block, network and broadcast
 *   addresses included ("192.168.5.0/30" gives .0, .1, .2 and .3)
 * - range "start-end": every address from start to end inclusive
 * - domain: the resolver's answers of the preferred family only
 *
 * Every expanded target carries the token as its origin and its own copy of
 * the port set.
 */
class TargetExpander {
public:
    /** Largest number of addresses one subnet or range may expand to. */
    static constexpr IpAddress::u128 max_expansion = IpAddress::u128(1) << 20;

    TargetExpander(Resolver &resolver, AddressFamilyPreference preference);

    /**
     * @param token One address token.
     * @param ports Port set copied into every target.
     * @return Targets in ascending address order (answer order for domains).
     * @throws AddressClassificationError, RangeOrderError, TargetLimitError, DnsError
     */
    std::vector<Target> expand(const std::string &token, const PortSet &ports) const;

private:
    Resolver &resolver;
    AddressFamilyPreference family_preference;

    std::vector<Target> expand_literal(const std::string &token, bool v6, const PortSet &ports) const;
    std::vector<Target> expand_subnet(const std::string &token, bool v6, const PortSet &ports) const;
    std::vector<Target> expand_range(const std::string &token, bool v6, const PortSet &ports) const;
    std::vector<Target> expand_domain(const std::string &token, const PortSet &ports) const;
    std::vector<Target> enumerate(const IpAddress &first, const IpAddress &last,
                                  const std::string &origin, const PortSet &ports) const;
};
