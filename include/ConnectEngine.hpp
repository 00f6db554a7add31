#pragma once
#include "ScanEngine.hpp"

/**
 * Engine built on plain TCP connect() calls, usable without raw socket
 * privileges. Supports ConnectPing and TcpConnect only.
 */
class ConnectEngine : public ScanEngine {
public:
    std::vector<ResultRecord> run(const std::vector<Target> &targets,
                                  const ScanConfig &config) override;

private:
    std::vector<ResultRecord> ping(const std::vector<Target> &targets, const ScanConfig &config);
    std::vector<ResultRecord> port_scan(const std::vector<Target> &targets, const ScanConfig &config);
};
