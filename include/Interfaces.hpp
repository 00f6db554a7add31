#pragma once
#include "IpAddress.hpp"
#include <string>
#include <vector>

struct CaptureInterface {
    std::string name;
    std::string description;
    std::vector<IpAddress> addresses;
};

/**
 * Lists capture devices known to libpcap together with their addresses.
 *
 * @throws InterfaceError if pcap can not enumerate the devices.
 */
std::vector<CaptureInterface> list_interfaces();

/**
 * Gets the first address of the given family on a device, skipping IPv6
 * link-local addresses.
 *
 * @param iface Device name (e.g. "eth0").
 * @param family Wanted address family.
 * @throws InterfaceError if the device is unknown or has no such address.
 */
IpAddress source_address(const std::string &iface, IpFamily family);
