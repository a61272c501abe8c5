#pragma once

#include <stdexcept>
#include <string>

namespace etfarb {

class EtfArbException : public std::runtime_error {
public:
    explicit EtfArbException(const std::string& message) : std::runtime_error(message) {}
    explicit EtfArbException(const char* message) : std::runtime_error(message) {}
};

class ConfigurationError : public EtfArbException {
public:
    explicit ConfigurationError(const std::string& message)
        : EtfArbException("Configuration Error: " + message) {}
};

} // namespace etfarb
