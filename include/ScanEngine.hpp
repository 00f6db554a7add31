#pragma once
#include "IpAddress.hpp"
#include "ScanResult.hpp"
#include "Target.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

enum class ScanMethod {
    ConnectPing,
    IcmpEcho,
    TcpSynPing,
    Mac,
    TcpConnect,
    TcpSyn,
    Udp,
    OsDetect
};

struct ScanConfig {
    /** Longest accepted probe timeout in seconds. */
    static constexpr double max_timeout = 3600.0;

    ScanMethod method = ScanMethod::ConnectPing;
    double timeout = 1.0;       // seconds per probe
    size_t threads = 64;
    int max_attempts = 2;
    std::optional<IpAddress> source;
};

std::string scan_method_name(ScanMethod method);

/** True for the host discovery methods. */
bool is_host_discovery(ScanMethod method);

/**
 * Abstract scanning engine.
 * Derived classes probe every target and return the complete result batch
 * once all probes have finished.
 */
class ScanEngine {
public:
    virtual ~ScanEngine() = default;

    /**
     * Probes the targets.
     *
     * @param targets Resolved targets.
     * @param config Method, timeout and worker settings.
     * @return One record per host (discovery, OS) or per host and port (port scan).
     * @throws EngineError if the method is unsupported or probing fails.
     */
    virtual std::vector<ResultRecord> run(const std::vector<Target> &targets,
                                          const ScanConfig &config) = 0;
};
