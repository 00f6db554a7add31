#include "ScanEngine.hpp"

std::string scan_method_name(ScanMethod method) {
    switch (method) {
        case ScanMethod::ConnectPing: return "tcp connect ping";
        case ScanMethod::IcmpEcho:    return "icmp echo ping";
        case ScanMethod::TcpSynPing:  return "tcp syn ping";
        case ScanMethod::Mac:         return "mac scan";
        case ScanMethod::TcpConnect:  return "tcp connect scan";
        case ScanMethod::TcpSyn:      return "tcp syn scan";
        case ScanMethod::Udp:         return "udp scan";
        case ScanMethod::OsDetect:    return "os detection";
    }
    return "unknown";
}

bool is_host_discovery(ScanMethod method) {
    return method == ScanMethod::ConnectPing || method == ScanMethod::IcmpEcho ||
           method == ScanMethod::TcpSynPing || method == ScanMethod::Mac;
}
