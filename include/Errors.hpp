#pragma once
#include <stdexcept>
#include <string>

/**
 * @brief Base class of every fatal error raised while resolving targets,
 * running the engine or reading options.
 */
class ReconError : public std::runtime_error {
public:
    explicit ReconError(const std::string &what) : std::runtime_error(what) {}
};

/** Malformed port token or invalid port range bounds. */
class PortParseError : public ReconError {
public:
    explicit PortParseError(const std::string &what) : ReconError(what) {}
};

/** Token is neither an address form nor a recognised domain name. */
class AddressClassificationError : public ReconError {
public:
    explicit AddressClassificationError(const std::string &what) : ReconError(what) {}
};

/** Address range whose start comes after its end. */
class RangeOrderError : public ReconError {
public:
    explicit RangeOrderError(const std::string &what) : ReconError(what) {}
};

/** Subnet or range too large to enumerate. */
class TargetLimitError : public ReconError {
public:
    explicit TargetLimitError(const std::string &what) : ReconError(what) {}
};

class DnsError : public ReconError {
public:
    explicit DnsError(const std::string &what) : ReconError(what) {}
};

class IOError : public ReconError {
public:
    explicit IOError(const std::string &what) : ReconError(what) {}
};

class EmptyTargetSetError : public ReconError {
public:
    explicit EmptyTargetSetError(const std::string &what) : ReconError(what) {}
};

class EngineError : public ReconError {
public:
    explicit EngineError(const std::string &what) : ReconError(what) {}
};

class InterfaceError : public ReconError {
public:
    explicit InterfaceError(const std::string &what) : ReconError(what) {}
};

class OptionError : public ReconError {
public:
    explicit OptionError(const std::string &what) : ReconError(what) {}
};
