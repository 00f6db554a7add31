#pragma once
#include "Target.hpp"
#include "TargetExpander.hpp"
#include <string>
#include <vector>

/**
 * @brief Turns user target input (comma lists or files) into targets.
 *
 * Tokens expand independently and in input order; the same address under
 * two different tokens is kept twice. Any failing token aborts the whole
 * batch.
 */
class BatchResolver {
public:
    explicit BatchResolver(const TargetExpander &expander);

    /**
     * Resolves a comma-separated list such as "10.0.0.1,10.0.1.0/24,example.com".
     *
     * @param spec The target list.
     * @param ports_spec Port specification applied to every target.
     * @throws EmptyTargetSetError if nothing resolves, plus any expander error.
     */
    std::vector<Target> resolve_list(const std::string &spec, const std::string &ports_spec) const;

    /**
     * Resolves a target file (same as nmap -iL). Each line is handled like a
     * resolve_list() spec, blank lines are skipped.
     *
     * @throws IOError if the file can not be read.
     */
    std::vector<Target> resolve_file(const std::string &path, const std::string &ports_spec) const;

private:
    const TargetExpander &expander;

    void append(const std::string &spec, const PortSet &ports, std::vector<Target> &targets) const;
};

/**
 * Drops targets whose address and ports equal an earlier target.
 * The first-seen target, and with it its origin, is kept.
 */
std::vector<Target> dedupe_targets(const std::vector<Target> &targets);
