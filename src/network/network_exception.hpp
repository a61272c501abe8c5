#pragma once

#include <stdexcept>
#include <string>

namespace etfarb {

// Transport-level failure: the request never produced a usable answer.
class NetworkException : public std::runtime_error {
public:
    explicit NetworkException(const std::string& message)
        : std::runtime_error(message) {}
};

class TimeoutException : public NetworkException {
public:
    explicit TimeoutException(const std::string& message)
        : NetworkException("Timeout: " + message) {}
};

class ConnectionException : public NetworkException {
public:
    explicit ConnectionException(const std::string& message)
        : NetworkException("Connection: " + message) {}
};

// A read endpoint answered with a non-2xx status. Writes report rejection
// through their return value instead.
class HttpStatusException : public NetworkException {
public:
    HttpStatusException(long status_code, const std::string& url)
        : NetworkException("HTTP " + std::to_string(status_code) + " from " + url),
          status_code_(status_code) {}

    long status_code() const { return status_code_; }

private:
    long status_code_;
};

} // namespace etfarb
