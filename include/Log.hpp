#pragma once
#include <string>

enum class LogLevel {
    Error = 0,
    Warning,
    Info,
    Debug
};

/**
 * Sets the most verbose level that still gets written to stderr.
 *
 * @param level New threshold, Warning by default.
 */
void set_log_level(LogLevel level);

/**
 * Writes "ERROR: <message>" to stderr. Errors are never filtered.
 *
 * @param message The message content.
 */
void log_error(const std::string &message);

void log_warning(const std::string &message);
void log_info(const std::string &message);
void log_debug(const std::string &message);
