#pragma once

#include <stdexcept>
#include <string>

namespace sentinel {

// Malformed or incomplete configuration. Fatal at startup.
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("config: " + message) {}
};

// Permanent failure reported by an external adapter.
class AdapterError : public std::runtime_error {
public:
    explicit AdapterError(const std::string& message)
        : std::runtime_error(message) {}
};

// Retryable failure: rate limit, connection reset, unavailable service.
class TransientError : public AdapterError {
public:
    explicit TransientError(const std::string& message)
        : AdapterError(message) {}
};

class TimeoutError : public TransientError {
public:
    explicit TimeoutError(const std::string& message)
        : TransientError(message) {}
};

} // namespace sentinel
