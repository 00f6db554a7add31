#pragma once
#include "IpAddress.hpp"
#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

using Elapsed = std::chrono::duration<double>;

enum class HostStatus {
    Up,
    Down
};

enum class PortStatus {
    Open,
    Closed,
    Filtered,
    Unfiltered,
    OpenFiltered,
    ClosedFiltered
};

enum class Protocol {
    Tcp,
    Udp
};

/** Host discovery outcome of one address. */
struct PingRecord {
    IpAddress address;
    HostStatus status;
    Elapsed elapsed;
};

/** Link-layer (ARP / NDP) discovery outcome; a known mac means the host is up. */
struct MacRecord {
    IpAddress address;
    std::optional<std::string> mac;
    std::optional<std::string> vendor;
    Elapsed elapsed;
};

/** Port scan outcome of one address and port. */
struct PortRecord {
    IpAddress address;
    uint16_t port;
    Protocol protocol;
    PortStatus status;
    Elapsed elapsed;
};

struct OsCandidate {
    std::string name;
    std::vector<std::string> cpes;
};

/** OS detection outcome, best candidate first. */
struct OsRecord {
    IpAddress address;
    std::vector<OsCandidate> candidates;
    Elapsed elapsed;
};

using ResultRecord = std::variant<PingRecord, MacRecord, PortRecord, OsRecord>;

std::string host_status_to_string(HostStatus status);
std::string port_status_to_string(PortStatus status);
std::string protocol_to_string(Protocol protocol);
