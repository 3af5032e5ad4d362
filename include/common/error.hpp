#ifndef FDFS_COMMON_ERROR_HPP
#define FDFS_COMMON_ERROR_HPP

#include <cstdint>
#include <stdexcept>
#include <string>

namespace fdfs {

// Base class for every error surfaced by the client
class FdfsError : public std::runtime_error {
public:
    explicit FdfsError(const std::string& message)
        : std::runtime_error(message) {}
};

// Missing trackers, bad config values, malformed addresses or file ids
class ConfigError : public FdfsError {
public:
    explicit ConfigError(const std::string& message)
        : FdfsError("Config error: " + message) {}
};

// Pool is at capacity with no idle connection, or has been destroyed
class PoolExhausted : public FdfsError {
public:
    explicit PoolExhausted(const std::string& address)
        : FdfsError("Connection pool exhausted: " + address) {}
};

class DialFailed : public FdfsError {
public:
    DialFailed(const std::string& address, const std::string& reason)
        : FdfsError("Dial to " + address + " failed: " + reason) {}
};

// None of the configured tracker pools could produce a connection
class NoTrackerAvailable : public FdfsError {
public:
    explicit NoTrackerAvailable(const std::string& last_error)
        : FdfsError("No tracker available: " + last_error) {}
};

// Tracker or storage answered with a non-zero status byte
class RemoteStatusError : public FdfsError {
public:
    explicit RemoteStatusError(uint8_t status)
        : FdfsError("Remote status error: " + std::to_string(status))
        , status_(status) {}

    uint8_t status() const { return status_; }

private:
    uint8_t status_;
};

class IOError : public FdfsError {
public:
    explicit IOError(const std::string& message)
        : FdfsError("I/O error: " + message) {}
};

// Response header or body does not match the expected layout
class MalformedResponse : public FdfsError {
public:
    explicit MalformedResponse(const std::string& message)
        : FdfsError("Malformed response: " + message) {}
};

} // namespace fdfs

#endif // FDFS_COMMON_ERROR_HPP
