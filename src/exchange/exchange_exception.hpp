#pragma once

#include <stdexcept>
#include <string>

namespace etfarb {

class ExchangeException : public std::runtime_error {
public:
    explicit ExchangeException(const std::string& message)
        : std::runtime_error(message) {}
};

// The venue answered with a payload we could not interpret.
class MalformedResponseException : public ExchangeException {
public:
    explicit MalformedResponseException(const std::string& message)
        : ExchangeException("Malformed response: " + message) {}
};

} // namespace etfarb
