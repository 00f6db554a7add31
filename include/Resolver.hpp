#pragma once
#include "IpAddress.hpp"
#include <string>
#include <vector>

/**
 * Abstract DNS collaborator.
 * Derived classes turn a host name into all of its A and AAAA addresses.
 */
class Resolver {
public:
    virtual ~Resolver() = default;

    /**
     * Resolves a host name.
     *
     * @param name The host name (e.g. "example.com").
     * @return Every address of the name, possibly none.
     * @throws DnsError if the lookup fails.
     */
    virtual std::vector<IpAddress> resolve(const std::string &name) = 0;
};

/** Resolver backed by getaddrinfo(). */
class SystemResolver : public Resolver {
public:
    std::vector<IpAddress> resolve(const std::string &name) override;
};
