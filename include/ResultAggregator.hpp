#pragma once
#include "ScanResult.hpp"
#include <cstddef>
#include <string>
#include <vector>

/** Numbers measured by the caller around the engine run. */
struct ScanSummary {
    size_t target_count = 0;
    double elapsed_seconds = 0.0;
};

/**
 * @brief Final rendered scan output: body lines followed by one tail line.
 */
struct Report {
    std::vector<std::string> lines;
    std::string tail;

    /** Body and tail joined with newlines, no trailing newline. */
    std::string str() const;
};

/**
 * @brief Sorts, de-duplicates and renders engine records.
 *
 * Lines are ordered by address (all IPv4 before IPv6) and then by port, so
 * the report only depends on the records' content and never on the order
 * the engine finished its probes in. When the same key shows up twice the
 * stronger observation is kept (up over down, open over closed...).
 *
 * Host discovery lists up hosts and collapses the rest into
 * "other N hosts -> down". Port scans list every address and port.
 * OS detection lists the candidates with their CPE names.
 *
 * @param records Complete record batch of one engine run.
 * @param summary Target count and wall-clock seconds for the tail line.
 * @return The report.
 */
Report aggregate(const std::vector<ResultRecord> &records, const ScanSummary &summary);

/** Formats seconds with two decimals, e.g. 0.5 -> "0.50". */
std::string format_seconds(double seconds);
