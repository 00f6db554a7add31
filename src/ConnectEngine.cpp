#include "ConnectEngine.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "WorkerPool.hpp"
#include <algorithm>
#include <arpa/inet.h>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

//the kernel does the handshake, connect() only reports how it ended:
//ESTABLISHED -> port open, RST (ECONNREFUSED) -> closed, no answer -> filtered
enum class ConnectState {
    Established,
    Refused,
    Timeout,
    Failed
};

static const PortSet default_ping_ports = {80, 443};

static socklen_t fill_sockaddr(struct sockaddr_storage &storage, const IpAddress &ip, uint16_t port) {
    std::memset(&storage, 0, sizeof(storage));
    if (ip.is_v6()) {
        auto *sin6 = reinterpret_cast<struct sockaddr_in6*>(&storage);
        sin6->sin6_family = AF_INET6;
        sin6->sin6_port = htons(port);
        inet_pton(AF_INET6, ip.to_string().c_str(), &sin6->sin6_addr);
        return sizeof(struct sockaddr_in6);
    }
    auto *sin = reinterpret_cast<struct sockaddr_in*>(&storage);
    sin->sin_family = AF_INET;
    sin->sin_port = htons(port);
    inet_pton(AF_INET, ip.to_string().c_str(), &sin->sin_addr);
    return sizeof(struct sockaddr_in);
}

/**
 * @brief Runs one non-blocking connect() and waits for its outcome.
 *
 * @param dst Destination address.
 * @param port Destination port.
 * @param source Optional address to bind before connecting.
 * @param timeout_ms How long to wait for the handshake.
 * @return How the connection attempt ended.
 */
static ConnectState connect_once(const IpAddress &dst, uint16_t port,
                                 const std::optional<IpAddress> &source, int timeout_ms) {
    int sock = socket(dst.is_v6() ? AF_INET6 : AF_INET, SOCK_STREAM | SOCK_NONBLOCK, 0);
    if (sock < 0)
        throw EngineError(std::string("socket: ") + std::strerror(errno));

    struct sockaddr_storage addr;
    if (source) {
        socklen_t src_len = fill_sockaddr(addr, *source, 0);
        if (bind(sock, reinterpret_cast<struct sockaddr*>(&addr), src_len) < 0) {
            int err = errno;
            close(sock);
            throw EngineError("bind " + source->to_string() + ": " + std::strerror(err));
        }
    }

    socklen_t len = fill_sockaddr(addr, dst, port);
    if (connect(sock, reinterpret_cast<struct sockaddr*>(&addr), len) == 0) {
        close(sock);
        return ConnectState::Established;
    }
    if (errno != EINPROGRESS) {
        int err = errno;
        close(sock);
        return err == ECONNREFUSED ? ConnectState::Refused : ConnectState::Failed;
    }

    struct pollfd pfd{};
    pfd.fd = sock;
    pfd.events = POLLOUT;
    int n = poll(&pfd, 1, timeout_ms);
    if (n <= 0) {
        close(sock);
        return n == 0 ? ConnectState::Timeout : ConnectState::Failed;
    }

    //Linux stores the final result of a non-blocking connect in SO_ERROR
    int err = 0;
    socklen_t err_len = sizeof(err);
    if (getsockopt(sock, SOL_SOCKET, SO_ERROR, &err, &err_len) < 0)
        err = errno;
    close(sock);

    if (err == 0) return ConnectState::Established;
    if (err == ECONNREFUSED) return ConnectState::Refused;
    if (err == ETIMEDOUT) return ConnectState::Timeout;
    return ConnectState::Failed;
}

/** Repeats timed out attempts up to config.max_attempts times. */
static ConnectState probe(const IpAddress &dst, uint16_t port, const ScanConfig &config) {
    double seconds = std::min(std::max(config.timeout, 0.0), ScanConfig::max_timeout);
    int timeout_ms = static_cast<int>(seconds * 1000.0);
    int attempts = std::max(1, config.max_attempts);
    ConnectState state = ConnectState::Timeout;
    for (int i = 0; i < attempts; ++i) {
        state = connect_once(dst, port, config.source, timeout_ms);
        if (state != ConnectState::Timeout) break;
    }
    return state;
}

static bool source_matches(const Target &target, const ScanConfig &config) {
    if (!config.source || config.source->family() == target.address.family())
        return true;
    log_warning(target.address.to_string() + " skipped (no source " +
                (target.address.is_v6() ? "IPv6" : "IPv4") + ")");
    return false;
}

std::vector<ResultRecord> ConnectEngine::run(const std::vector<Target> &targets,
                                             const ScanConfig &config) {
    switch (config.method) {
        case ScanMethod::ConnectPing:
            return ping(targets, config);
        case ScanMethod::TcpConnect:
            return port_scan(targets, config);
        default:
            throw EngineError(scan_method_name(config.method) +
                              " needs raw sockets and is not supported by the connect engine");
    }
}

std::vector<ResultRecord> ConnectEngine::ping(const std::vector<Target> &targets,
                                              const ScanConfig &config) {
    size_t threads = std::min(config.threads, std::max<size_t>(targets.size(), 1));
    log_info("connect ping of " + std::to_string(targets.size()) + " targets, " +
             std::to_string(threads) + " threads");

    std::vector<std::future<ResultRecord>> futures;
    futures.reserve(targets.size());
    WorkerPool pool(threads);
    for (const Target &target : targets) {
        futures.emplace_back(pool.enqueue([&config, target]() -> ResultRecord {
            auto start = std::chrono::steady_clock::now();
            HostStatus status = HostStatus::Down;
            if (source_matches(target, config)) {
                const PortSet &ports = target.ports.empty() ? default_ping_ports : target.ports;
                for (uint16_t port : ports) {
                    ConnectState state = probe(target.address, port, config);
                    // a RST still proves somebody is there
                    if (state == ConnectState::Established || state == ConnectState::Refused) {
                        status = HostStatus::Up;
                        break;
                    }
                }
            }
            return PingRecord{target.address, status, std::chrono::steady_clock::now() - start};
        }));
    }

    std::vector<ResultRecord> records;
    records.reserve(futures.size());
    for (auto &future : futures)
        records.push_back(future.get());
    return records;
}

std::vector<ResultRecord> ConnectEngine::port_scan(const std::vector<Target> &targets,
                                                   const ScanConfig &config) {
    size_t jobs = 0;
    for (const Target &target : targets) {
        if (target.ports.empty())
            throw EngineError("tcp connect scan needs ports, " + target.address.to_string() +
                              " has none (use -p)");
        jobs += target.ports.size();
    }
    size_t threads = std::min(config.threads, std::max<size_t>(jobs, 1));
    log_info("connect scan of " + std::to_string(jobs) + " ports on " +
             std::to_string(targets.size()) + " targets, " + std::to_string(threads) + " threads");

    std::vector<std::future<ResultRecord>> futures;
    futures.reserve(jobs);
    WorkerPool pool(threads);
    for (const Target &target : targets) {
        bool usable = source_matches(target, config);
        for (uint16_t port : target.ports) {
            IpAddress dst = target.address;
            futures.emplace_back(pool.enqueue([&config, dst, port, usable]() -> ResultRecord {
                auto start = std::chrono::steady_clock::now();
                PortStatus status = PortStatus::Filtered;
                if (usable) {
                    switch (probe(dst, port, config)) {
                        case ConnectState::Established: status = PortStatus::Open; break;
                        case ConnectState::Refused:     status = PortStatus::Closed; break;
                        default:                        status = PortStatus::Filtered; break;
                    }
                }
                return PortRecord{dst, port, Protocol::Tcp, status,
                                  std::chrono::steady_clock::now() - start};
            }));
        }
    }

    std::vector<ResultRecord> records;
    records.reserve(futures.size());
    for (auto &future : futures)
        records.push_back(future.get());
    return records;
}
