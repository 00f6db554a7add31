#pragma once
#include <cstdint>
#include <string>
#include <vector>

/** Distinct ports in first-seen order. Empty means "no ports requested". */
using PortSet = std::vector<uint16_t>;

/**
 * @brief Parses a port specification string into a list of port numbers.
 *
 * Supports single ports (e.g. "80"), inclusive ranges (e.g. "20-25") and
 * comma-separated mixtures of both (e.g. "22,80,443-445"). A range needs
 * start < end. Empty or whitespace-only input gives an empty set.
 *
 * @param spec The port specification.
 * @return The ports with duplicates removed, first occurrence kept.
 * @throws PortParseError naming the offending segment.
 */
PortSet parse_ports(const std::string &spec);

/** Renders the set back as "a,b,c". */
std::string ports_to_string(const PortSet &ports);
