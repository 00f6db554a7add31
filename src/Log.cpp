#include "Log.hpp"
#include <iostream>

static LogLevel current_level = LogLevel::Warning;

void set_log_level(LogLevel level) {
    current_level = level;
}

static void write_line(LogLevel level, const char *prefix, const std::string &message) {
    if (level > current_level) return;
    std::cerr << prefix << message << std::endl;
}

void log_error(const std::string &message) {
    std::cerr << "ERROR: " << message << std::endl;
}

void log_warning(const std::string &message) {
    write_line(LogLevel::Warning, "WARNING: ", message);
}

void log_info(const std::string &message) {
    write_line(LogLevel::Info, "INFO: ", message);
}

void log_debug(const std::string &message) {
    write_line(LogLevel::Debug, "DEBUG: ", message);
}
