#pragma once
#include <string>

/**
 * @brief Static set of top-level domain labels from the IANA root zone.
 *
 * Used to tell "probably a domain name" apart from a mistyped address.
 * New or unlisted TLDs are not recognised.
 */
class TldRegistry {
public:
    /**
     * Case-insensitive membership test.
     *
     * @param label A single label without dots, e.g. "com".
     * @return true if label is a listed TLD.
     */
    static bool contains(const std::string &label);

    static size_t size();
};
