#include "ResultAggregator.hpp"
#include <iomanip>
#include <map>
#include <sstream>
#include <utility>

std::string host_status_to_string(HostStatus status) {
    switch (status) {
        case HostStatus::Up:
            return "up";
        case HostStatus::Down:
            return "down";
    }
    return "unknown";
}

std::string port_status_to_string(PortStatus status) {
    switch (status) {
        case PortStatus::Open:
            return "open";
        case PortStatus::Closed:
            return "closed";
        case PortStatus::Filtered:
            return "filtered";
        case PortStatus::Unfiltered:
            return "unfiltered";
        case PortStatus::OpenFiltered:
            return "open|filtered";
        case PortStatus::ClosedFiltered:
            return "closed|filtered";
    }
    return "unknown";
}

std::string protocol_to_string(Protocol protocol) {
    return protocol == Protocol::Udp ? "udp" : "tcp";
}

std::string format_seconds(double seconds) {
    std::ostringstream out;
    out << std::fixed << std::setprecision(2) << seconds;
    return out.str();
}

std::string Report::str() const {
    std::string out;
    for (const auto &line : lines) {
        out += line;
        out += '\n';
    }
    out += tail;
    return out;
}

// --- one render function per record kind ---

static std::string render(const PingRecord &r) {
    return r.address.to_string() + " -> " + host_status_to_string(r.status) +
           " (" + format_seconds(r.elapsed.count()) + "s)";
}

static std::string render(const MacRecord &r) {
    std::string line = r.address.to_string() + " -> " +
                       host_status_to_string(r.mac ? HostStatus::Up : HostStatus::Down) +
                       " (" + format_seconds(r.elapsed.count()) + "s)";
    if (r.mac) line += " (" + *r.mac + ")";
    if (r.mac && r.vendor) line += " (" + *r.vendor + ")";
    return line;
}

static std::string render(const PortRecord &r) {
    std::string addr = r.address.is_v6() ? "[" + r.address.to_string() + "]" : r.address.to_string();
    return addr + ":" + std::to_string(r.port) + "/" + protocol_to_string(r.protocol) +
           " -> " + port_status_to_string(r.status) +
           " (" + format_seconds(r.elapsed.count()) + "s)";
}

static std::string render(const OsRecord &r) {
    std::string line = r.address.to_string() + " -> ";
    if (r.candidates.empty())
        line += "no match";
    for (size_t i = 0; i < r.candidates.size(); ++i) {
        const OsCandidate &c = r.candidates[i];
        if (i) line += " | ";
        line += c.name;
        if (!c.cpes.empty()) {
            line += " [";
            for (size_t j = 0; j < c.cpes.size(); ++j) {
                if (j) line += ", ";
                line += c.cpes[j];
            }
            line += "]";
        }
    }
    return line + " (" + format_seconds(r.elapsed.count()) + "s)";
}

// --- duplicate resolution, higher is stronger ---

static int strength(const PingRecord &r) {
    return r.status == HostStatus::Up ? 1 : 0;
}

static int strength(const MacRecord &r) {
    return r.mac ? 1 : 0;
}

static int strength(const PortRecord &r) {
    switch (r.status) {
        case PortStatus::Open:           return 5;
        case PortStatus::OpenFiltered:   return 4;
        case PortStatus::Unfiltered:     return 3;
        case PortStatus::Filtered:       return 2;
        case PortStatus::ClosedFiltered: return 1;
        case PortStatus::Closed:         return 0;
    }
    return 0;
}

static int strength(const OsRecord &r) {
    return static_cast<int>(r.candidates.size());
}

template <typename Record>
static bool replaces(const Record &candidate, const Record &current) {
    int a = strength(candidate), b = strength(current);
    if (a != b) return a > b;
    if (candidate.elapsed != current.elapsed) return candidate.elapsed < current.elapsed;
    return render(candidate) < render(current);
}

template <typename Key, typename Record>
static void keep(std::map<Key, Record> &group, const Key &key, const Record &record) {
    auto it = group.find(key);
    if (it == group.end())
        group.emplace(key, record);
    else if (replaces(record, it->second))
        it->second = record;
}

namespace {

using PortKey = std::pair<uint16_t, Protocol>;

struct Groups {
    std::map<IpAddress, PingRecord> ping;
    std::map<IpAddress, MacRecord> mac;
    std::map<IpAddress, std::map<PortKey, PortRecord>> port;
    std::map<IpAddress, OsRecord> os;

    void operator()(const PingRecord &r) { keep(ping, r.address, r); }
    void operator()(const MacRecord &r) { keep(mac, r.address, r); }
    void operator()(const PortRecord &r) { keep(port[r.address], PortKey(r.port, r.protocol), r); }
    void operator()(const OsRecord &r) { keep(os, r.address, r); }
};

}

template <typename Record>
static size_t render_discovery(const std::map<IpAddress, Record> &group,
                               std::vector<std::string> &lines) {
    size_t up = 0, not_up = 0;
    for (const auto &entry : group) {
        if (strength(entry.second) > 0) {
            up++;
            lines.push_back(render(entry.second));
        } else {
            not_up++;
        }
    }
    if (not_up > 0)
        lines.push_back("other " + std::to_string(not_up) + " hosts -> " +
                        host_status_to_string(HostStatus::Down));
    return up;
}

Report aggregate(const std::vector<ResultRecord> &records, const ScanSummary &summary) {
    Groups groups;
    for (const ResultRecord &record : records)
        std::visit(groups, record);

    Report report;
    size_t hosts_up = 0;
    size_t ports_open = 0;

    hosts_up += render_discovery(groups.ping, report.lines);
    hosts_up += render_discovery(groups.mac, report.lines);

    for (const auto &host : groups.port) {
        for (const auto &entry : host.second) {
            if (entry.second.status == PortStatus::Open)
                ports_open++;
            report.lines.push_back(render(entry.second));
        }
    }

    for (const auto &entry : groups.os)
        report.lines.push_back(render(entry.second));

    std::string counts;
    if (!groups.ping.empty() || !groups.mac.empty())
        counts = " (" + std::to_string(hosts_up) + " hosts up)";
    else if (!groups.port.empty())
        counts = " (" + std::to_string(ports_open) + " ports open)";

    report.tail = "netrecon done: " + std::to_string(summary.target_count) + " ip addresses" +
                  counts + " scanned in " + format_seconds(summary.elapsed_seconds) + " seconds";
    return report;
}
