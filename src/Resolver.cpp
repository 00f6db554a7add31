#include "Resolver.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include <arpa/inet.h>
#include <netdb.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <algorithm>

/**
 * @brief Resolves a hostname to its corresponding IPv4 and IPv6 addresses.
 *
 * Answers keep the order getaddrinfo() returned them in; repeated addresses
 * are dropped.
 *
 * @param name The hostname to resolve (e.g. "google.com").
 * @return A list of resolved IP addresses.
 */
std::vector<IpAddress> SystemResolver::resolve(const std::string &name) {
    std::vector<IpAddress> addrs;
    struct addrinfo hints{}, *res = nullptr, *rp = nullptr;
    hints.ai_family = AF_UNSPEC;
    hints.ai_socktype = SOCK_STREAM;

    int rc = getaddrinfo(name.c_str(), nullptr, &hints, &res);
    if (rc != 0)
        throw DnsError("dns query " + name + " failed: " + gai_strerror(rc));

    char buf[INET6_ADDRSTRLEN];
    for (rp = res; rp; rp = rp->ai_next) {
        const char *text = nullptr;
        if (rp->ai_family == AF_INET) {
            auto *sin = reinterpret_cast<struct sockaddr_in*>(rp->ai_addr);
            text = inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
        } else if (rp->ai_family == AF_INET6) {
            auto *sin6 = reinterpret_cast<struct sockaddr_in6*>(rp->ai_addr);
            text = inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
        }
        if (!text) continue;

        std::optional<IpAddress> ip = IpAddress::parse(text);
        if (ip && std::find(addrs.begin(), addrs.end(), *ip) == addrs.end())
            addrs.push_back(*ip);
    }
    freeaddrinfo(res);

    log_debug("dns " + name + ": " + std::to_string(addrs.size()) + " addresses");
    return addrs;
}
