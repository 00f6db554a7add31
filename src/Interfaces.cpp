#include "Interfaces.hpp"
#include "Errors.hpp"
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <pcap.h>

/**
 * @brief Converts a pcap address entry to an IpAddress.
 *
 * @param sa Socket address from pcap_addr_t.
 * @param out Receives the address.
 * @return false for non-IP families (e.g. AF_PACKET).
 */
static bool to_ip(const struct sockaddr *sa, IpAddress &out) {
    if (!sa) return false;
    char buf[INET6_ADDRSTRLEN];
    const char *text = nullptr;
    if (sa->sa_family == AF_INET) {
        auto *sin = reinterpret_cast<const struct sockaddr_in*>(sa);
        text = inet_ntop(AF_INET, &sin->sin_addr, buf, sizeof(buf));
    } else if (sa->sa_family == AF_INET6) {
        auto *sin6 = reinterpret_cast<const struct sockaddr_in6*>(sa);
        if (IN6_IS_ADDR_LINKLOCAL(&sin6->sin6_addr)) return false;
        text = inet_ntop(AF_INET6, &sin6->sin6_addr, buf, sizeof(buf));
    }
    if (!text) return false;
    std::optional<IpAddress> ip = IpAddress::parse(text);
    if (!ip) return false;
    out = *ip;
    return true;
}

std::vector<CaptureInterface> list_interfaces() {
    char errbuf[PCAP_ERRBUF_SIZE];
    pcap_if_t *alldevs = nullptr;
    if (pcap_findalldevs(&alldevs, errbuf) == -1)
        throw InterfaceError(std::string("pcap_findalldevs: ") + errbuf);

    std::vector<CaptureInterface> result;
    for (pcap_if_t *dev = alldevs; dev; dev = dev->next) {
        CaptureInterface iface;
        iface.name = dev->name;
        if (dev->description) iface.description = dev->description;
        for (pcap_addr_t *a = dev->addresses; a; a = a->next) {
            IpAddress ip;
            if (to_ip(a->addr, ip))
                iface.addresses.push_back(ip);
        }
        result.push_back(iface);
    }
    pcap_freealldevs(alldevs);
    return result;
}

IpAddress source_address(const std::string &iface, IpFamily family) {
    for (const CaptureInterface &dev : list_interfaces()) {
        if (dev.name != iface) continue;
        for (const IpAddress &ip : dev.addresses) {
            if (ip.family() == family)
                return ip;
        }
        throw InterfaceError("no usable " + std::string(family == IpFamily::V6 ? "IPv6" : "IPv4") +
                             " source address on " + iface);
    }
    throw InterfaceError("unknown interface " + iface);
}
