#include "BatchResolver.hpp"
#include "Errors.hpp"
#include "Log.hpp"
#include "Utils.hpp"
#include <fstream>
#include <set>
#include <utility>

BatchResolver::BatchResolver(const TargetExpander &e) : expander(e) {}

void BatchResolver::append(const std::string &spec, const PortSet &ports,
                           std::vector<Target> &targets) const {
    for (const std::string &token : split(spec, ',')) {
        std::vector<Target> expanded = expander.expand(token, ports);
        log_debug(token + " -> " + std::to_string(expanded.size()) + " targets");
        targets.insert(targets.end(), expanded.begin(), expanded.end());
    }
}

static PortSet requested_ports(const std::string &ports_spec) {
    PortSet ports = parse_ports(ports_spec);
    if (!ports.empty())
        log_debug("ports " + ports_to_string(ports));
    return ports;
}

std::vector<Target> BatchResolver::resolve_list(const std::string &spec,
                                                const std::string &ports_spec) const {
    PortSet ports = requested_ports(ports_spec);
    std::vector<Target> targets;
    append(spec, ports, targets);
    if (targets.empty())
        throw EmptyTargetSetError("unable to parse the target '" + spec + "'");
    return targets;
}

std::vector<Target> BatchResolver::resolve_file(const std::string &path,
                                                const std::string &ports_spec) const {
    PortSet ports = requested_ports(ports_spec);
    std::ifstream file(path);
    if (!file.is_open())
        throw IOError("can not open file [" + path + "]");

    std::vector<Target> targets;
    std::string line;
    size_t lineno = 0;
    while (std::getline(file, line)) {
        lineno++;
        if (trim(line).empty()) continue;
        try {
            append(line, ports, targets);
        } catch (const ReconError &) {
            log_error(path + ":" + std::to_string(lineno) + ": " + trim(line));
            throw;
        }
    }
    if (file.bad())
        throw IOError("can not read file [" + path + "]");
    if (targets.empty())
        throw EmptyTargetSetError("no targets in file [" + path + "]");
    return targets;
}

std::vector<Target> dedupe_targets(const std::vector<Target> &targets) {
    std::set<std::pair<IpAddress, PortSet>> seen;
    std::vector<Target> unique;
    for (const Target &t : targets) {
        if (seen.insert({t.address, t.ports}).second)
            unique.push_back(t);
    }
    return unique;
}
