#pragma once
#include <string>
#include <vector>

/**
 * Removes leading and trailing whitespace.
 *
 * @param str The input string.
 * @return The trimmed copy.
 */
std::string trim(const std::string &str);

/**
 * Splits the string on every occurrence of delim, trims each piece and drops
 * the pieces that end up empty.
 *
 * @param str The input string.
 * @param delim Separator character, e.g. ','.
 * @return Non-empty trimmed tokens in input order.
 */
std::vector<std::string> split(const std::string &str, char delim);

/**
 * Checks whether the string consists of decimal digits only.
 *
 * @param str The string to check.
 * @return true if str is non-empty and all digits, false otherwise.
 */
bool isDigits(const std::string &str);

std::string toLower(const std::string &str);
